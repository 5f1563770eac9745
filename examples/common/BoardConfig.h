/**
 * @file BoardConfig.h
 * @brief Example board configuration for ESP32-S2 / ESP32-S3 reference hardware.
 *
 * These are convenience defaults for reference designs only.
 * NOT part of the library API. Override for your hardware.
 *
 * @warning The library itself is board-agnostic. The UART is passed via Config.
 *          These defaults are provided for examples only.
 */

#pragma once

#include <Arduino.h>
#include <stdint.h>

#include "common/SerialTransport.h"

namespace board {

// ====================================================================
// EXAMPLE DEFAULTS - ESP32-S2 / ESP32-S3 REFERENCE HARDWARE
// ====================================================================
// These values are NOT library defaults. They are example-only values.
// Override them for your board by creating your own BoardConfig.h or
// passing explicit values to Config structs in your application.
// ====================================================================

/// @brief UART RX pin, wired to the sensor TXD.
static constexpr int SDS_RX = 18;

/// @brief UART TX pin, wired to the sensor RXD.
static constexpr int SDS_TX = 17;

/// @brief The sensor only talks 9600 8N1.
static constexpr uint32_t SDS_BAUD = 9600;

/// @brief Serial timeout in milliseconds for example transfers.
static constexpr uint32_t SDS_TIMEOUT_MS = 1000;

/// @brief UART used for the sensor.
inline HardwareSerial& sdsPort() {
  return Serial1;
}

/// @brief Initialize the sensor UART using the default config.
inline bool initSerial() {
  return transport::initSerial(sdsPort(), SDS_RX, SDS_TX, SDS_BAUD);
}

}  // namespace board
