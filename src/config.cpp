#include "config.h"

ProgrammerConfig bb_defaultConfig() {
    ProgrammerConfig config;
    config.baudRate = c_maxBaudRate;
    config.writeCycleDelay = std::chrono::milliseconds(c_writeCycleDelayMs);
    return config;
}

bbError bb_validateConfig(const ProgrammerConfig& config) {
    if (config.baudRate < c_minBaudRate || config.baudRate > c_maxBaudRate) {
        return bbError_BaudRateOutOfRange;
    }

    return bbError_OK;
}
