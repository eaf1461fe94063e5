#include "rtmidiport.h"

RtMidiPort::RtMidiPort()
    : midiout(0)
{
    midiout = new RtMidiOut();
}

RtMidiPort::~RtMidiPort()
{
    delete midiout;
}

unsigned int RtMidiPort::getPortCount()
{
    return midiout->getPortCount();
}

std::string RtMidiPort::getPortName(unsigned int portNumber)
{
    return midiout->getPortName(portNumber);
}

void RtMidiPort::openPort(unsigned int portNumber, const std::string &portName)
{
    midiout->openPort(portNumber, portName);
}

void RtMidiPort::openVirtualPort(const std::string &portName)
{
    midiout->openVirtualPort(portName);
}

void RtMidiPort::sendMessage(std::vector<unsigned char> *message)
{
    midiout->sendMessage(message);
}

void RtMidiPort::closePort()
{
    midiout->closePort();
}
