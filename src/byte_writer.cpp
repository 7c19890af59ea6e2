#include "byte_writer.h"
#include "config.h"

TimedByteWriter::TimedByteWriter(ByteSink& sink, Clock& clock, Clock::Duration writeCycleDelay)
    : m_addrLow(sink, Channel_AddrLow)
    , m_addrHigh(sink, Channel_AddrHigh)
    , m_data(sink, Channel_Data)
    , m_clock(clock)
    , m_writeCycleDelay(writeCycleDelay)
    , m_lastWrite(clock.now())
    , m_inSession(false) {
}

bbError TimedByteWriter::begin() {
    // The port may have been reopened, or the board power cycled, since the
    // last session. Nothing is known about the latches.
    m_addrLow.invalidate();
    m_addrHigh.invalidate();
    m_data.invalidate();

    bbError status = m_addrHigh.write(c_writeDisableBit);
    if (status != bbError_OK) {
        return status;
    }

    // If the EEPROM was inserted before this, a write of byte 0 may be in
    // progress. Treat it like one of ours and wait out the write cycle.
    m_lastWrite = m_clock.now();
    m_inSession = true;
    return bbError_OK;
}

bbError TimedByteWriter::writeByte(uint16_t address, uint8_t value) {
    if (!m_inSession) {
        return bbError_OutOfSession;
    }

    if (address >= c_addressSpaceSize) {
        return bbError_AddressOverflow;
    }

    uint8_t addrHigh = address >> 8;

    // The sub-100ns setup and hold times of the AT28C256 are all lower
    // limits. At 24k baud one telegram alone takes ~400us, so they are
    // always met.
    bbError status = m_data.write(value);
    if (status != bbError_OK) {
        return status;
    }

    status = m_addrLow.write(address & 0xff);
    if (status != bbError_OK) {
        return status;
    }

    // The address is latched on the falling edge of ~WE. Setting the high
    // address bits in the same telegram that pulls ~WE low could race, so
    // they are set up first with ~WE still high.
    status = m_addrHigh.write(addrHigh | c_writeDisableBit);
    if (status != bbError_OK) {
        return status;
    }

    Clock::Duration delay = (m_lastWrite + m_writeCycleDelay) - m_clock.now();
    if (delay > Clock::Duration::zero()) {
        m_clock.sleepFor(delay);
    }

    // Strobe ~WE, active low. The rising edge latches the data.
    status = m_addrHigh.write(addrHigh);
    if (status != bbError_OK) {
        return status;
    }

    status = m_addrHigh.write(addrHigh | c_writeDisableBit);
    if (status != bbError_OK) {
        return status;
    }

    m_lastWrite = m_clock.now();
    return bbError_OK;
}

bbError TimedByteWriter::setOutputs(uint8_t value) {
    if (!m_inSession) {
        return bbError_OutOfSession;
    }

    bbError status = m_addrLow.write(value);
    if (status != bbError_OK) {
        return status;
    }

    status = m_addrHigh.write(value);
    if (status != bbError_OK) {
        return status;
    }

    return m_data.write(value);
}
