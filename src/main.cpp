#include <stdio.h>
#include <chrono>

#include "bb_error.h"
#include "byte_source.h"
#include "cli.h"
#include "config.h"
#include "diff_writer.h"
#include "session.h"

enum ExitCode {
    Exit_OK      = 0,
    Exit_Failure = 1,
    Exit_Usage   = 2,
};

static int commandInit(ProgrammerSession& session);
static int commandFlash(ProgrammerSession& session, const CommandLine& cmd,
                        FileByteSource& file, FileByteSource* oldFile);
static int commandPinTest(ProgrammerSession& session);

static int nak(const char* message, bbError status);

int main(int argc, char** argv) {
    CommandLine cmd;
    bbError status = bb_parseCommandLine(argc, argv, cmd);
    if (status != bbError_OK) {
        bb_printUsage(stderr, argv[0]);
        return Exit_Usage;
    }

    if (cmd.command == Command_Help) {
        bb_printUsage(stdout, argv[0]);
        return Exit_OK;
    }

    status = bb_validateConfig(cmd.config);
    if (status != bbError_OK) {
        return nak("Invalid configuration", status);
    }

    // Open the input files before touching the programmer, so a typo in a
    // file name can't leave the latches in some half written state.
    FileByteSource file;
    FileByteSource oldFile;
    if (cmd.command == Command_Flash) {
        status = file.open(cmd.file);
        if (status != bbError_OK) {
            return nak(cmd.file, status);
        }

        if (cmd.oldFile != NULL) {
            status = oldFile.open(cmd.oldFile);
            if (status != bbError_OK) {
                return nak(cmd.oldFile, status);
            }
        }
    }

    ProgrammerSession session(cmd.config);
    status = session.begin(cmd.device);
    if (status != bbError_OK) {
        return nak(cmd.device, status);
    }

    switch (cmd.command) {
    case Command_Init:
        return commandInit(session);

    case Command_Flash:
        return commandFlash(session, cmd, file,
                            cmd.oldFile != NULL ? &oldFile : NULL);

    case Command_PinTest:
        return commandPinTest(session);

    default:
        return Exit_Usage;
    }
}

static int commandInit(ProgrammerSession&) {
    // ~WE was driven high when the session began.
    printf("Initialized. Ready for EEPROM insertion.\n");
    return Exit_OK;
}

static int commandFlash(ProgrammerSession& session, const CommandLine& cmd,
                        FileByteSource& file, FileByteSource* oldFile) {
    if (oldFile != NULL) {
        printf("Note: Flashing in changes only mode.\n");
    }

    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

    ConsoleRunReporter reporter(stdout);
    DiffWriteDriver driver(session.writer(), reporter);

    bbError status = driver.run(file, oldFile);
    if (status != bbError_OK) {
        return nak(cmd.file, status);
    }

    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    printf("Writing took %.3fs.\n", elapsed.count());
    return Exit_OK;
}

static int commandPinTest(ProgrammerSession& session) {
    // Every value on every latch output. Check with a logic analyser.
    for (unsigned value = 0; value < 256; value++) {
        bbError status = session.writer().setOutputs((uint8_t)value);
        if (status != bbError_OK) {
            return nak("Pin test failed", status);
        }
    }

    printf("Pin test done.\n");
    return Exit_OK;
}

static int nak(const char* message, bbError status) {
    fprintf(stderr, "NAK:%s: %s\n", message, bb_errorMessage(status));
    return bb_isPreconditionViolation(status) ? Exit_Usage : Exit_Failure;
}
