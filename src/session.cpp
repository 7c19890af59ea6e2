#include "session.h"

ProgrammerSession::ProgrammerSession(const ProgrammerConfig& config)
    : m_config(config)
    , m_port()
    , m_clock()
    , m_writer(m_port, m_clock, config.writeCycleDelay) {
}

ProgrammerSession::~ProgrammerSession() {
    end();
}

bbError ProgrammerSession::begin(const char* device) {
    bbError status = m_port.open(device, m_config.baudRate);
    if (status != bbError_OK) {
        return status;
    }

    status = m_writer.begin();
    if (status != bbError_OK) {
        end();
        return status;
    }

    return bbError_OK;
}

void ProgrammerSession::end() {
    m_writer.end();
    m_port.close();
}
