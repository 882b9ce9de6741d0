/*
  OmixLog.cpp - Log formatting shared by the Arduino and desktop builds.
*/
#include "OmixLog.h"
#include "OmixConfig.h"
#include "OmixPlatform.h"

#include <stdarg.h>
#include <stdio.h>

static bool g_omix_debug = false;

void omixSetDebug(const bool debug) {
    g_omix_debug = debug;
}

bool omixDebugEnabled() {
    return g_omix_debug;
}

void omixLog(const OmixLogLevel level, const char* fmt, ...) {
    if (level == OMIX_LOG_DEBUG && !g_omix_debug) {
        return;
    }

    char buf[OMIX_LOG_LINE_MAX];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    char levelChar;
    switch (level) {
        case OMIX_LOG_ERROR: levelChar = 'E'; break;
        case OMIX_LOG_WARN:  levelChar = 'W'; break;
        case OMIX_LOG_INFO:  levelChar = 'I'; break;
        default:             levelChar = 'D'; break;
    }

    omix_platform_log(levelChar, buf);
}

void omixLogBytes(const char* prefix, const uint8_t* data, const size_t length) {
    if (!g_omix_debug) {
        return;
    }

    // 3 chars per byte; long packets are cut short rather than split
    char hex[OMIX_LOG_LINE_MAX / 2];
    size_t pos = 0;

    for (size_t i = 0; i < length && pos + 4 < sizeof(hex); i++) {
        pos += snprintf(hex + pos, sizeof(hex) - pos, i == 0 ? "%02x" : " %02x", data[i]);
    }
    hex[pos] = '\0';

    omixLog(OMIX_LOG_DEBUG, "%s [%uB]: %s", prefix, static_cast<unsigned>(length), hex);
}
