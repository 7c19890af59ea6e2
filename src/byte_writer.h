#ifndef INCLUDE_BYTE_WRITER_H
#define INCLUDE_BYTE_WRITER_H

#include <stdint.h>

#include "bb_error.h"
#include "byte_sink.h"
#include "clock.h"
#include "output_channel.h"

// Latch assignment on the programmer board.
enum ChannelId {
    Channel_AddrLow  = 0,   // A0-A7
    Channel_AddrHigh = 1,   // A8-A14, ~WE
    Channel_Data     = 2,   // D0-D7
};

// ~WE sits on the top output of the high address latch, where A15 would be.
const uint8_t c_writeDisableBit = 0x80;

class ByteWriter {
public:
    virtual ~ByteWriter() {}

    virtual bbError writeByte(uint16_t address, uint8_t value) = 0;
};

// Writes single bytes to an AT28C256 through three SN74LV8153 latches,
// keeping at least writeCycleDelay between the end of one write pulse and
// the start of the next.
class TimedByteWriter : public ByteWriter {
public:
    TimedByteWriter(ByteSink& sink, Clock& clock, Clock::Duration writeCycleDelay);

    // The SN74LV8153 powers up with all outputs low, which means ~WE is
    // active. Drive it high before the EEPROM goes in, otherwise byte 0 may
    // be overwritten with 0x00.
    bbError begin();
    void end() { m_inSession = false; }

    bbError writeByte(uint16_t address, uint8_t value);

    // Puts value on all three latches without strobing ~WE. Only useful with
    // no EEPROM inserted, for checking the wiring with a logic analyser.
    bbError setOutputs(uint8_t value);

    bool inSession() const { return m_inSession; }
    Clock::TimePoint lastWriteTime() const { return m_lastWrite; }

private:
    OutputChannel    m_addrLow;
    OutputChannel    m_addrHigh;
    OutputChannel    m_data;
    Clock&           m_clock;
    Clock::Duration  m_writeCycleDelay;
    Clock::TimePoint m_lastWrite;
    bool             m_inSession;
};

#endif // INCLUDE_BYTE_WRITER_H
