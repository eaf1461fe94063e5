///////////////////////////////////////////////////////////////////////////////
//general includes
///////////////////////////////////////////////////////////////////////////////

#include <stdio.h>
#include <stdlib.h>
#include <cstdlib>

#include "midipulse.h"
#include "rtmidiport.h"

///////////////////////////////////////////////////////////////////////////////
//main
///////////////////////////////////////////////////////////////////////////////

int main(int argc, char *argv[])
{
    RtMidiPort *midiout = 0;
    RUN_MODE_T mode = parseArguments(argc, argv);

    if (mode == HELP_MODE)
    {
        printf("%s",CLIENT_HELP_STR);
        return 0;
    }

    if (mode == USAGE_ERROR)
    {
        printf("%s",CLIENT_HELP_STR);
        return -1;
    }

    // RtMidiOut constructor
    try
    {
        midiout = new RtMidiPort();
    }
    catch ( RtMidiError &error )
    {
        error.printMessage();
        exit( EXIT_FAILURE );
    }

    if (mode == LIST_MODE)
    {
        try
        {
            listOutputPorts(midiout);
        }
        catch ( RtMidiError &error )
        {
            error.printMessage();
            exit( EXIT_FAILURE );
        }

        delete midiout;
        return 0;
    }

    registerSignalHandler();

    try
    {
        selectOutputPort(midiout);
        emitNotes(midiout, platformSleep);
    }
    catch ( RtMidiError &error )
    {
        error.printMessage();
        exit( EXIT_FAILURE );
    }

    midiout->closePort();
    delete midiout;

    printf("Exiting. Bye.\n");
    return 0;
}
