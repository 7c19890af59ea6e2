#include "serial_port.h"
#include "config.h"
#include "log.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

// termios2 lets us set the non-standard rates the SN74LV8153 wants (24000
// isn't one of the Bnnn constants). It clashes with <termios.h>, so don't
// include that here.
#include <asm/termbits.h>
#include <sys/ioctl.h>

SerialPort::SerialPort()
    : m_fd(-1) {
}

SerialPort::~SerialPort() {
    close();
}

bbError SerialPort::open(const char* device, uint32_t baudRate) {
    if (baudRate < c_minBaudRate || baudRate > c_maxBaudRate) {
        return bbError_BaudRateOutOfRange;
    }

    close();

    m_fd = ::open(device, O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (m_fd < 0) {
        bb_msg("Cannot open %s: %s", device, strerror(errno));
        return bbError_DeviceOpenFailed;
    }

    bbError status = configure(baudRate);
    if (status != bbError_OK) {
        close();
        return status;
    }

    return bbError_OK;
}

bbError SerialPort::configure(uint32_t baudRate) {
    struct termios2 tio;
    if (ioctl(m_fd, TCGETS2, &tio) < 0) {
        bb_msg("TCGETS2 failed: %s", strerror(errno));
        return bbError_DeviceConfigFailed;
    }

    // Raw mode, 8N1, no flow control.
    tio.c_iflag = 0;
    tio.c_oflag = 0;
    tio.c_lflag = 0;
    tio.c_cflag &= ~(CSIZE | PARENB | CSTOPB | CRTSCTS | CBAUD | (CBAUD << IBSHIFT));
    tio.c_cflag |= CS8 | CLOCAL | CREAD | BOTHER | (BOTHER << IBSHIFT);
    tio.c_ispeed = baudRate;
    tio.c_ospeed = baudRate;
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (ioctl(m_fd, TCSETS2, &tio) < 0) {
        bb_msg("TCSETS2 failed: %s", strerror(errno));
        return bbError_DeviceConfigFailed;
    }

    return bbError_OK;
}

void SerialPort::close() {
    if (m_fd < 0) {
        return;
    }

    // Wait for the last telegrams to leave, otherwise the final ~WE release
    // may be lost.
    if (ioctl(m_fd, TCSBRK, 1) < 0) {
        bb_msg("Drain failed: %s", strerror(errno));
    }

    ::close(m_fd);
    m_fd = -1;
}

bbError SerialPort::write(const uint8_t* data, size_t size) {
    if (m_fd < 0) {
        return bbError_OutOfSession;
    }

    while (size > 0) {
        ssize_t written = ::write(m_fd, data, size);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            bb_msg("Write failed: %s", strerror(errno));
            return bbError_DeviceWriteFailed;
        }

        data += written;
        size -= (size_t)written;
    }

    return bbError_OK;
}
