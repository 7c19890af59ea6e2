#ifndef INCLUDE_BYTE_SOURCE_H
#define INCLUDE_BYTE_SOURCE_H

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

#include "bb_error.h"

// Pulls bytes one at a time, from logical address 0 upwards.
class ByteSource {
public:
    virtual ~ByteSource() {}

    // On success either stores the next byte in byte, or sets eof when the
    // input is exhausted. byte is left alone at eof.
    virtual bbError next(uint8_t& byte, bool& eof) = 0;
};

class FileByteSource : public ByteSource {
public:
    FileByteSource();
    ~FileByteSource();

    bbError open(const char* path);
    void close();

    bbError next(uint8_t& byte, bool& eof);

private:
    FileByteSource(const FileByteSource&) = delete;
    FileByteSource& operator=(const FileByteSource&) = delete;

    FILE* m_file;
};

// Does not copy or own the buffer.
class BufferByteSource : public ByteSource {
public:
    BufferByteSource(const uint8_t* data, size_t size);

    bbError next(uint8_t& byte, bool& eof);

private:
    const uint8_t* m_data;
    size_t         m_size;
    size_t         m_offset;
};

#endif // INCLUDE_BYTE_SOURCE_H
