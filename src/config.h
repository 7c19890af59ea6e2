#ifndef INCLUDE_CONFIG_H
#define INCLUDE_CONFIG_H

#include <stdint.h>
#include <chrono>

#include "bb_error.h"

// SN74LV8153 serial input is rated for 2k to 24k baud.
const uint32_t c_minBaudRate = 2000;
const uint32_t c_maxBaudRate = 24000;

// AT28C256 write cycle time (tWC) is <= 10ms. USB serial adapters are not
// very timing accurate, the worst deviation measured was -2.5ms, so we pad
// the rating by half.
const uint32_t c_writeCycleRatingMs = 10;
const uint32_t c_writeCycleDelayMs  = c_writeCycleRatingMs + c_writeCycleRatingMs / 2;

// 32k, A0-A14
const uint32_t c_addressSpaceSize = 1u << 15;

struct ProgrammerConfig {
    uint32_t baudRate;
    std::chrono::milliseconds writeCycleDelay;
};

extern ProgrammerConfig bb_defaultConfig();
extern bbError bb_validateConfig(const ProgrammerConfig& config);

#endif // INCLUDE_CONFIG_H
