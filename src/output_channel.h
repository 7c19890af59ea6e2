#ifndef INCLUDE_OUTPUT_CHANNEL_H
#define INCLUDE_OUTPUT_CHANNEL_H

#include <stdint.h>

#include "bb_error.h"
#include "byte_sink.h"

// Up to eight SN74LV8153 can share one serial line, selected by the three
// address pins A0-A2.
const uint8_t c_channelCount = 8;

// One value goes out as two consecutive UART telegrams (8N1):
//
//   ,- UART start bit (=0)
//   |   ,- protocol start bit (=1)
//   |   |   ,- 3 address bits
//   |   |   |              ,- 4 data bits (low nibble, then high nibble)
//   |   |   |              |                   ,- UART stop bit (=1)
//   v   v   v              v                   v
// .----------------------------------------------.
// | 0 | 1 | A0 | A1 | A2 | D0 | D1 | D2 | D3 | 1 |
// '----------------------------------------------'
//
// UART sends lsb first, so the protocol start bit is bit 0 of the payload.
// The chip discards the first telegram if the second doesn't follow it
// directly.
struct Telegram {
    uint8_t low;
    uint8_t high;
};

extern Telegram sn_encode(uint8_t channel, uint8_t value);

inline bool sn_isValidChannel(uint8_t channel) {
    return channel < c_channelCount;
}

// A single SN74LV8153 output latch.
class OutputChannel {
public:
    OutputChannel(ByteSink& sink, uint8_t channel);

    // Puts value on the latch outputs. Skipped if the latch already holds
    // value, since we don't use SOUT and the outputs wouldn't change.
    bbError write(uint8_t value);

    // Forget the latched value, so the next write always goes out.
    void invalidate() { m_valueKnown = false; }

    uint8_t channel() const     { return m_channel; }
    bool    valueKnown() const  { return m_valueKnown; }
    uint8_t value() const       { return m_value; }

private:
    ByteSink& m_sink;
    uint8_t   m_channel;
    bool      m_valueKnown;
    uint8_t   m_value;
};

#endif // INCLUDE_OUTPUT_CHANNEL_H
