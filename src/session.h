#ifndef INCLUDE_SESSION_H
#define INCLUDE_SESSION_H

#include "bb_error.h"
#include "byte_writer.h"
#include "clock.h"
#include "config.h"
#include "serial_port.h"

// Owns the serial port and the writer driving the three latches for the
// duration of a programming run. The port is released when the session
// goes out of scope, whichever way that happens.
class ProgrammerSession {
public:
    explicit ProgrammerSession(const ProgrammerConfig& config);
    ~ProgrammerSession();

    bbError begin(const char* device);
    void end();

    TimedByteWriter& writer() { return m_writer; }

private:
    ProgrammerSession(const ProgrammerSession&) = delete;
    ProgrammerSession& operator=(const ProgrammerSession&) = delete;

    ProgrammerConfig m_config;
    SerialPort       m_port;
    SteadyClock      m_clock;
    TimedByteWriter  m_writer;
};

#endif // INCLUDE_SESSION_H
