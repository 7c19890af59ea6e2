#include "byte_source.h"
#include "log.h"

#include <errno.h>
#include <string.h>

FileByteSource::FileByteSource()
    : m_file(NULL) {
}

FileByteSource::~FileByteSource() {
    close();
}

bbError FileByteSource::open(const char* path) {
    close();

    m_file = fopen(path, "rb");
    if (m_file == NULL) {
        bb_msg("Cannot open %s: %s", path, strerror(errno));
        return bbError_FileOpenFailed;
    }

    return bbError_OK;
}

void FileByteSource::close() {
    if (m_file != NULL) {
        fclose(m_file);
        m_file = NULL;
    }
}

bbError FileByteSource::next(uint8_t& byte, bool& eof) {
    if (m_file == NULL) {
        return bbError_FileReadFailed;
    }

    // stdio buffers for us, so a byte at a time is fine.
    int c = fgetc(m_file);
    if (c == EOF) {
        if (ferror(m_file)) {
            bb_msg("Read error: %s", strerror(errno));
            return bbError_FileReadFailed;
        }
        eof = true;
        return bbError_OK;
    }

    byte = (uint8_t)c;
    eof = false;
    return bbError_OK;
}

BufferByteSource::BufferByteSource(const uint8_t* data, size_t size)
    : m_data(data)
    , m_size(size)
    , m_offset(0) {
}

bbError BufferByteSource::next(uint8_t& byte, bool& eof) {
    if (m_offset >= m_size) {
        eof = true;
        return bbError_OK;
    }

    byte = m_data[m_offset++];
    eof = false;
    return bbError_OK;
}
