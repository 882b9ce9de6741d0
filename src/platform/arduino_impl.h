/*
  arduino_impl.h - Platform primitives for Arduino/ESP32 builds.
*/
#pragma once

#include <Arduino.h>
#include <stdint.h>

static inline uint32_t omix_platform_millis() {
    return millis();
}

static inline uint32_t omix_platform_random() {
    return static_cast<uint32_t>(random(0x7FFFFFFF));
}

static inline void omix_platform_log(const char level, const char* message) {
    Serial.printf("[%lu] %c: %s\n", millis(), level, message);
}
