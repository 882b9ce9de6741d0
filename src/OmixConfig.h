/*
  OmixConfig.h - Compile-time settings for the OmixArduinoBLE library.
  Any of these can be overridden by defining it before including
  OmixArduinoBLE.h.
*/
#pragma once

#define LIBRARY_VERSION "1.0.0"

// DiFluid Omix GATT layout (protocol v1.1, firmware V021)
#define SUUID_OMIX_SDK  "000000E2-0000-1000-8000-00805F9B34FB"
#define SUUID_OMIX_APP  "000000E1-0000-1000-8000-00805F9B34FB"
#define CHAR_OMIX_DATA  "0000FF02-0000-1000-8000-00805F9B34FB"
#define SHORT_OMIX_SDK  0x00E2
#define SHORT_OMIX_APP  0x00E1
#define SHORT_OMIX_DATA 0xFF02

// Advertised name fragments ("Omix XXXXXX", "Omix Plus XXXXXX")
#define NAME_OMIX       "Omix"
#define NAME_DIFLUID    "DiFluid"

#ifndef OMIX_ADAPTER_TIMEOUT_MS
#define OMIX_ADAPTER_TIMEOUT_MS      10000
#endif

#ifndef OMIX_CONNECT_TIMEOUT_MS
#define OMIX_CONNECT_TIMEOUT_MS      5000
#endif

// Large enough for the 120 byte Agtron payload plus framing
#ifndef OMIX_REQUESTED_MTU
#define OMIX_REQUESTED_MTU           185
#endif

#ifndef OMIX_SCAN_DIAGNOSTIC_MS
#define OMIX_SCAN_DIAGNOSTIC_MS      5000
#endif

#ifndef OMIX_AUTO_CONNECT_WINDOW_MS
#define OMIX_AUTO_CONNECT_WINDOW_MS  10000
#endif

#ifndef OMIX_SCAN_NAME_SAMPLES
#define OMIX_SCAN_NAME_SAMPLES       20
#endif

#ifndef OMIX_MAX_HISTORY
#define OMIX_MAX_HISTORY             50
#endif

// Omix addresses remembered between scan and connect
#ifndef OMIX_MAX_PEER_ADDRESSES
#define OMIX_MAX_PEER_ADDRESSES      16
#endif

#ifndef OMIX_LOG_LINE_MAX
#define OMIX_LOG_LINE_MAX            256
#endif

// Fallback RSSI when a peripheral is reported without one
#define OMIX_RSSI_CONNECTED          -50
#define OMIX_RSSI_UNKNOWN            -100

#define OMIX_DEFAULT_DEVICE_NAME     "DiFluid Device"

// NVS storage keys
#define OMIX_NVS_NAMESPACE           "omix"
#define OMIX_NVS_LAST_DEVICE         "last_device"
