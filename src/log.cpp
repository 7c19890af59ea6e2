#include "log.h"

#include <stdarg.h>
#include <stdio.h>

void bb_msg(const char* format, ...) {
    va_list args;
    va_start(args, format);

    fputs("MSG:", stderr);
    vfprintf(stderr, format, args);
    fputs("\n", stderr);

    va_end(args);
}
