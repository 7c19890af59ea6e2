#ifndef INCLUDE_SERIAL_PORT_H
#define INCLUDE_SERIAL_PORT_H

#include <stddef.h>
#include <stdint.h>

#include "bb_error.h"
#include "byte_sink.h"

// Raw 8N1 tty, write only. Closed on destruction.
class SerialPort : public ByteSink {
public:
    SerialPort();
    ~SerialPort();

    bbError open(const char* device, uint32_t baudRate);
    void close();

    bool isOpen() const { return m_fd >= 0; }

    bbError write(const uint8_t* data, size_t size);

private:
    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    bbError configure(uint32_t baudRate);

    int m_fd;
};

#endif // INCLUDE_SERIAL_PORT_H
