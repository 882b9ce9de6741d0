/*
  OmixLog.h - Leveled, printf-style logging for OmixArduinoBLE.
  Debug output is only produced when the library was created with debug = true.
*/
#pragma once

#include <stddef.h>
#include <stdint.h>

enum OmixLogLevel {
    OMIX_LOG_ERROR = 0,
    OMIX_LOG_WARN,
    OMIX_LOG_INFO,
    OMIX_LOG_DEBUG
};

void omixSetDebug(bool debug);
bool omixDebugEnabled();

void omixLog(OmixLogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

// Hex dump of a buffer at debug level, e.g. "RX [7B]: df df 03 01 01 01 c4"
void omixLogBytes(const char* prefix, const uint8_t* data, size_t length);

#define OMIX_LOGE(fmt, ...) omixLog(OMIX_LOG_ERROR, fmt, ##__VA_ARGS__)
#define OMIX_LOGW(fmt, ...) omixLog(OMIX_LOG_WARN, fmt, ##__VA_ARGS__)
#define OMIX_LOGI(fmt, ...) omixLog(OMIX_LOG_INFO, fmt, ##__VA_ARGS__)
#define OMIX_LOGD(fmt, ...) do { if (omixDebugEnabled()) omixLog(OMIX_LOG_DEBUG, fmt, ##__VA_ARGS__); } while (0)
