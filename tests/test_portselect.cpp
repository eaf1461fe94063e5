// Port selection: first output port when there is one, virtual port otherwise.
#undef NDEBUG
#include <cassert>
#include <iostream>

#include "midipulse.h"
#include "fakeport.h"
#include "capture.h"

static void opensFirstPortOfOne()
{
    FakePort port;
    port.ports.push_back("Port A");

    int selected = selectOutputPort(&port);

    assert(selected == 0);
    assert(port.openedPort == 0);
    assert(port.openedName == "Port A");
    assert(port.clientName == OUTPUT_PORT_NAME);
    assert(port.sent.empty());
}

static void opensIndexZeroOfMany()
{
    FakePort port;
    port.ports.push_back("Midi Through Port-0");
    port.ports.push_back("USB Keyboard MIDI 1");
    port.ports.push_back("Synth Input");

    int selected = selectOutputPort(&port);

    assert(selected == 0);
    assert(port.openedPort == 0);
    assert(port.openedName == "Midi Through Port-0");
}

static void opensVirtualPortWithoutPorts()
{
    FakePort port;

    int selected = selectOutputPort(&port);

    assert(selected == VIRTUAL_PORT_SELECTED);
    assert(port.openedPort == VIRTUAL_PORT_SELECTED);
    assert(port.openedName == "My virtual output");
}

static void printsPortsBeforeOpening()
{
    FakePort port;
    port.ports.push_back("Port A");
    port.ports.push_back("Port B");

    StdoutCapture capture;
    capture.start();
    selectOutputPort(&port);
    std::string out = capture.stop();

    assert(out == "\t\tOutput Port 0  : 'Port A'\n"
                  "\t\tOutput Port 1  : 'Port B'\n");
}

static void announcesVirtualPort()
{
    FakePort port;

    StdoutCapture capture;
    capture.start();
    selectOutputPort(&port);
    std::string out = capture.stop();

    assert(out == "No MIDI output ports available, opening virtual port 'My virtual output'\n");
}

static void listingPrintsCountAndNames()
{
    FakePort port;
    port.ports.push_back("Port A");
    port.ports.push_back("Port B");

    StdoutCapture capture;
    capture.start();
    listOutputPorts(&port);
    std::string out = capture.stop();

    assert(out == "\nThere are 2 MIDI output ports available.\n"
                  "\t\tOutput Port 0  : 'Port A'\n"
                  "\t\tOutput Port 1  : 'Port B'\n"
                  "\n");
    assert(port.openedPort == -2);
    assert(port.sent.empty());
}

static void listingWithoutPorts()
{
    FakePort port;

    StdoutCapture capture;
    capture.start();
    listOutputPorts(&port);
    std::string out = capture.stop();

    assert(out == "\nThere are 0 MIDI output ports available.\n\n");
    assert(port.openedPort == -2);
}

int main()
{
    opensFirstPortOfOne();
    opensIndexZeroOfMany();
    opensVirtualPortWithoutPorts();
    printsPortsBeforeOpening();
    announcesVirtualPort();
    listingPrintsCountAndNames();
    listingWithoutPorts();

    std::cout << "test_portselect passed\n";
    return 0;
}
