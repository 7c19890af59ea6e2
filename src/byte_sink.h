#ifndef INCLUDE_BYTE_SINK_H
#define INCLUDE_BYTE_SINK_H

#include <stddef.h>
#include <stdint.h>

#include "bb_error.h"

// Anything that takes the raw telegram stream. In production this is the
// serial port, in tests a buffer.
class ByteSink {
public:
    virtual ~ByteSink() {}

    // Writes all size bytes, in order, or returns an error.
    virtual bbError write(const uint8_t* data, size_t size) = 0;
};

#endif // INCLUDE_BYTE_SINK_H
