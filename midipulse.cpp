///////////////////////////////////////////////////////////////////////////////
//OS dependent includes
///////////////////////////////////////////////////////////////////////////////

#if OS_IS_LINUX == 1 || OS_IS_MACOSX == 1 || OS_IS_CYGWIN == 1
#include <unistd.h>             //  usleep
#include <signal.h>
#elif OS_IS_WIN32 == 1
#include <windows.h>
#else
#error "Invalid Platform"
#endif

///////////////////////////////////////////////////////////////////////////////
//general includes
///////////////////////////////////////////////////////////////////////////////

#include <stdio.h>
#include <string.h>
#include <signal.h>
#include <iostream>

#include "midipulse.h"

// Platform-dependent sleep routines.
#if OS_IS_LINUX == 1 || OS_IS_MACOSX == 1 || OS_IS_CYGWIN == 1
#define SLEEP( milliseconds ) usleep( (unsigned long) (milliseconds * 1000.0) )
#else
#define SLEEP( milliseconds ) Sleep( (DWORD) milliseconds )
#endif

static volatile sig_atomic_t doExit=0;
static volatile sig_atomic_t caughtSignal=0;

static const unsigned char noteOn[]  = { NOTE_ON_STATUS,  NOTE_NUMBER, NOTE_ON_VELOCITY };
static const unsigned char noteOff[] = { NOTE_OFF_STATUS, NOTE_NUMBER, NOTE_OFF_VELOCITY };

const char *CLIENT_HELP_STR =
    "\n"
    " midipulse Version 0.01 help\n"
    "\n"
    " Invoking \"midipulse\":\n"
    " midipulse         (play middle C on the first MIDI output port, forever)\n"
    "   The note is held for 500ms and released for 100ms.\n"
    "   Without any MIDI output port a virtual port named\n"
    "   '" VIRTUAL_PORT_NAME "' is created instead.\n"
    "   Press Ctrl-C to stop.\n"
    " midipulse --list  (Gives a list of available midi output ports)\n"
    " midipulse --help  (This text)\n"
    "\n";

RUN_MODE_T parseArguments(int argc, char *argv[])
{
    if (argc == 1)
    {
        return RUN_MODE;
    }
    if (argc > 2)
    {
        return USAGE_ERROR;
    }
    if (!strncmp(argv[1],"--help",6))
    {
        return HELP_MODE;
    }
    if (!strncmp(argv[1],"--list",6))
    {
        return LIST_MODE;
    }
    return USAGE_ERROR;
}

void platformSleep(unsigned int milliseconds)
{
    SLEEP(milliseconds);
}

#if OS_IS_LINUX == 1 || OS_IS_MACOSX == 1 || OS_IS_CYGWIN == 1
// reported by emitNotes, printf is not async-signal-safe
void signalHandler(int s)
{
    caughtSignal=s;
    doExit=1;
}
#endif

void registerSignalHandler(void)
{
#if OS_IS_LINUX == 1 || OS_IS_MACOSX == 1 || OS_IS_CYGWIN == 1
   struct sigaction sigIntHandler;

   sigIntHandler.sa_handler = signalHandler;
   sigemptyset(&sigIntHandler.sa_mask);
   sigIntHandler.sa_flags = 0;

   sigaction(SIGINT, &sigIntHandler, NULL);
#else
	return;
#endif
}

void requestExit(void)
{
    doExit=1;
}

void clearExit(void)
{
    doExit=0;
    caughtSignal=0;
}

bool exitRequested(void)
{
    return doExit!=0;
}

void listOutputPorts(MidiOutPort *midiout)
{
    unsigned int nPorts = midiout->getPortCount();
    std::cout << "\nThere are " << nPorts << " MIDI output ports available.\n";
    for ( unsigned int i=0; i<nPorts; i++ )
    {
        std::string portName = midiout->getPortName(i);
        printf("\t\tOutput Port %-3d: '%s'\n",i,portName.c_str());
    }
    std::cout << '\n';
}

int selectOutputPort(MidiOutPort *midiout)
{
    unsigned int nPorts = midiout->getPortCount();

    if (nPorts == 0)
    {
        printf("No MIDI output ports available, opening virtual port '%s'\n",VIRTUAL_PORT_NAME);
        midiout->openVirtualPort(VIRTUAL_PORT_NAME);
        return VIRTUAL_PORT_SELECTED;
    }

    for ( unsigned int i=0; i<nPorts; i++ )
    {
        std::string portName = midiout->getPortName(i);
        printf("\t\tOutput Port %-3d: '%s'\n",i,portName.c_str());
    }

    midiout->openPort(0,OUTPUT_PORT_NAME);
    return 0;
}

unsigned long emitNotes(MidiOutPort *midiout, sleepFunc_t sleepFunc)
{
    std::vector<unsigned char> message;
    unsigned long cycles=0;

    while (!doExit)
    {
        message.assign(noteOn, noteOn+sizeof(noteOn));
        printf("Sending note on\n");
        midiout->sendMessage( &message );
        sleepFunc(NOTE_ON_TIME_MS);

        // always release the note, even when interrupted while it is held
        message.assign(noteOff, noteOff+sizeof(noteOff));
        printf("Sending note off\n");
        midiout->sendMessage( &message );
        sleepFunc(NOTE_OFF_TIME_MS);

        cycles++;
    }

    if (caughtSignal)
    {
        printf("Caught signal %d\n",(int) caughtSignal);
    }

    return cycles;
}
