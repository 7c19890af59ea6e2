#include "output_channel.h"

Telegram sn_encode(uint8_t channel, uint8_t value) {
    uint8_t header = (channel << 1) | 1;

    Telegram telegram;
    telegram.low  = ((value & 0x0f) << 4) | header;
    telegram.high = (value & 0xf0)        | header;
    return telegram;
}

OutputChannel::OutputChannel(ByteSink& sink, uint8_t channel)
    : m_sink(sink)
    , m_channel(channel)
    , m_valueKnown(false)
    , m_value(0) {
}

bbError OutputChannel::write(uint8_t value) {
    if (!sn_isValidChannel(m_channel)) {
        return bbError_InvalidChannel;
    }

    if (m_valueKnown && value == m_value) {
        return bbError_OK;
    }

    // Both telegrams in one write, so nothing can get between them.
    Telegram telegram = sn_encode(m_channel, value);
    uint8_t buffer[2] = { telegram.low, telegram.high };

    bbError status = m_sink.write(buffer, sizeof(buffer));
    if (status != bbError_OK) {
        // We don't know how much of it made it onto the wire.
        m_valueKnown = false;
        return status;
    }

    m_value = value;
    m_valueKnown = true;
    return bbError_OK;
}
