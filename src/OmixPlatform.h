/*
  OmixPlatform.h - Selects the platform primitives for the current build.
*/
#pragma once

#ifdef ARDUINO
#include "platform/arduino_impl.h"
#else
#include "platform/native_impl.h"
#endif
