/*
  native_impl.h - Platform primitives for desktop builds (unit tests).
*/
#pragma once

#include <inttypes.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <time.h>

static inline uint32_t omix_platform_millis() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint32_t>((ts.tv_sec * 1000) + (ts.tv_nsec / 1000000));
}

static inline uint32_t omix_platform_random() {
    return static_cast<uint32_t>(rand());
}

static inline void omix_platform_log(const char level, const char* message) {
    printf("[%" PRIu32 "] %c: %s\n", omix_platform_millis(), level, message);
}
