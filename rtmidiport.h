#ifndef RTMIDIPORT_H
#define RTMIDIPORT_H

#include <RtMidi.h>

#include "midipulse.h"

/**
 * MidiOutPort backed by an RtMidiOut. The constructor throws RtMidiError
 * when no MIDI driver can be opened.
 */
class RtMidiPort : public MidiOutPort
{
public:
    RtMidiPort();
    virtual ~RtMidiPort();

    virtual unsigned int getPortCount();
    virtual std::string getPortName(unsigned int portNumber);
    virtual void openPort(unsigned int portNumber, const std::string &portName);
    virtual void openVirtualPort(const std::string &portName);
    virtual void sendMessage(std::vector<unsigned char> *message);
    virtual void closePort();

private:
    RtMidiPort(const RtMidiPort &);
    RtMidiPort &operator=(const RtMidiPort &);

    RtMidiOut *midiout;
};

#endif
