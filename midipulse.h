#ifndef MIDIPULSE_H
#define MIDIPULSE_H

#include <string>
#include <vector>

///////////////////////////////////////////////////////////////////////////////
//defines
///////////////////////////////////////////////////////////////////////////////

#define NOTE_ON_STATUS          0x90    // note on, channel 1
#define NOTE_OFF_STATUS         0x80    // note off, channel 1
#define NOTE_NUMBER             60      // middle C
#define NOTE_ON_VELOCITY        112
#define NOTE_OFF_VELOCITY       0

#define NOTE_ON_TIME_MS         500
#define NOTE_OFF_TIME_MS        100

#define VIRTUAL_PORT_NAME       "My virtual output"
#define OUTPUT_PORT_NAME        "MidiPulse Output"

#define VIRTUAL_PORT_SELECTED   (-1)

/**
 * The part of a MIDI output the emitter talks to. RtMidiPort forwards it
 * to RtMidiOut; errors surface as whatever the backend throws.
 */
class MidiOutPort
{
public:
    virtual ~MidiOutPort() {}

    virtual unsigned int getPortCount() = 0;
    virtual std::string getPortName(unsigned int portNumber) = 0;
    virtual void openPort(unsigned int portNumber, const std::string &portName) = 0;
    virtual void openVirtualPort(const std::string &portName) = 0;
    virtual void sendMessage(std::vector<unsigned char> *message) = 0;
    virtual void closePort() = 0;
};

typedef enum
{
    RUN_MODE,
    LIST_MODE,
    HELP_MODE,
    USAGE_ERROR
} RUN_MODE_T;

typedef void (*sleepFunc_t)(unsigned int milliseconds);

extern const char *CLIENT_HELP_STR;

/**
 * No arguments runs the emitter, "--list" and "--help" select their modes.
 * Anything else, including extra arguments, is a USAGE_ERROR.
 */
RUN_MODE_T parseArguments(int argc, char *argv[]);

void platformSleep(unsigned int milliseconds);

void registerSignalHandler(void);
void requestExit(void);
void clearExit(void);
bool exitRequested(void);

void listOutputPorts(MidiOutPort *midiout);

/**
 * Opens port 0 if the system has any output ports, after printing them.
 * Otherwise opens a virtual port named VIRTUAL_PORT_NAME.
 *
 * Returns the opened port index, or VIRTUAL_PORT_SELECTED.
 */
int selectOutputPort(MidiOutPort *midiout);

/**
 * Sends note on, waits NOTE_ON_TIME_MS, sends note off, waits
 * NOTE_OFF_TIME_MS. Repeats until requestExit() is called; the flag is only
 * checked between cycles. Returns the number of completed cycles.
 */
unsigned long emitNotes(MidiOutPort *midiout, sleepFunc_t sleepFunc);

#endif
