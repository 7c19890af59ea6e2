#ifndef INCLUDE_CLI_H
#define INCLUDE_CLI_H

#include <stdio.h>

#include "bb_error.h"
#include "config.h"

enum Command {
    Command_Help,
    Command_Init,
    Command_Flash,
    Command_PinTest,
};

struct CommandLine {
    Command          command;
    const char*      device;
    const char*      file;
    const char*      oldFile;   // NULL unless --only-changes
    ProgrammerConfig config;
};

// Fills in cmd from argv. Strings point into argv. Returns bbError_Usage if
// the command line doesn't make sense. Option values are not range checked
// here, see bb_validateConfig().
extern bbError bb_parseCommandLine(int argc, char** argv, CommandLine& cmd);

extern void bb_printUsage(FILE* out, const char* program);

#endif // INCLUDE_CLI_H
