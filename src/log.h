#ifndef INCLUDE_LOG_H
#define INCLUDE_LOG_H

// Prints a "MSG:" diagnostic line to stderr. A trailing newline is added.
extern void bb_msg(const char* format, ...);

#endif // INCLUDE_LOG_H
