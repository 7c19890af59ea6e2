#include "cli.h"

#include <errno.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>

static const char* optionValue(const char* arg, const char* name) {
    size_t length = strlen(name);
    if (strncmp(arg, name, length) == 0 && arg[length] == '=') {
        return arg + length + 1;
    }
    return NULL;
}

// Rejects anything that isn't plain decimal digits, or is larger than max.
static bool parseUnsigned(const char* text, unsigned long max, unsigned long& value) {
    if (text == NULL || *text < '0' || *text > '9') {
        return false;
    }

    char* end = NULL;
    errno = 0;
    value = strtoul(text, &end, 10);
    if (errno == ERANGE || *end != 0) {
        return false;
    }

    return value <= max;
}

// A minute between bytes is already far beyond any EEPROM's write cycle.
static const unsigned long c_maxWriteCycleMs = 60000;

bbError bb_parseCommandLine(int argc, char** argv, CommandLine& cmd) {
    cmd.command = Command_Help;
    cmd.device  = NULL;
    cmd.file    = NULL;
    cmd.oldFile = NULL;
    cmd.config  = bb_defaultConfig();

    const char* positional[3];
    int positionalCount = 0;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        const char* value;
        unsigned long number;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            cmd.command = Command_Help;
            return bbError_OK;
        }
        else if ((value = optionValue(arg, "--only-changes")) != NULL) {
            if (*value == 0) {
                return bbError_Usage;
            }
            cmd.oldFile = value;
        }
        else if ((value = optionValue(arg, "--baud")) != NULL) {
            if (!parseUnsigned(value, UINT32_MAX, number)) {
                return bbError_Usage;
            }
            cmd.config.baudRate = (uint32_t)number;
        }
        else if ((value = optionValue(arg, "--write-cycle")) != NULL) {
            if (!parseUnsigned(value, c_maxWriteCycleMs, number)) {
                return bbError_Usage;
            }
            cmd.config.writeCycleDelay = std::chrono::milliseconds(number);
        }
        else if (arg[0] == '-' && arg[1] == '-') {
            return bbError_Usage;
        }
        else {
            if (positionalCount == 3) {
                return bbError_Usage;
            }
            positional[positionalCount++] = arg;
        }
    }

    if (positionalCount == 0) {
        return bbError_Usage;
    }

    const char* name = positional[0];

    if (strcmp(name, "init") == 0 || strcmp(name, "pintest") == 0) {
        if (positionalCount != 2 || cmd.oldFile != NULL) {
            return bbError_Usage;
        }
        cmd.command = (name[0] == 'i') ? Command_Init : Command_PinTest;
        cmd.device  = positional[1];
        return bbError_OK;
    }

    if (strcmp(name, "flash") == 0) {
        if (positionalCount != 3) {
            return bbError_Usage;
        }
        cmd.command = Command_Flash;
        cmd.device  = positional[1];
        cmd.file    = positional[2];
        return bbError_OK;
    }

    return bbError_Usage;
}

void bb_printUsage(FILE* out, const char* program) {
    fprintf(out,
        "Program EEPROM with provided binary data.\n"
        "\n"
        "Usage: %s [options] init DEVICE\n"
        "       %s [options] flash [--only-changes=OLD_FILE] DEVICE FILE\n"
        "       %s [options] pintest DEVICE\n"
        "       %s -h | --help\n"
        "\n"
        "Arguments:\n"
        "  DEVICE  path to the serial device\n"
        "  FILE    binary input file\n"
        "\n"
        "Options:\n"
        "  -h --help                show this help\n"
        "  --only-changes=OLD_FILE  flash only bytes that differ in FILE and OLD_FILE\n"
        "  --baud=RATE              serial bit rate, 2000 to 24000 [default: 24000]\n"
        "  --write-cycle=MS         minimum time between byte writes [default: 15]\n"
        "\n"
        "Warning: Make sure to run `init` before inserting your EEPROM,\n"
        "         otherwise the first byte may be overwritten to zero.\n"
        "         Run `pintest` with no EEPROM inserted only.\n",
        program, program, program, program);
}
