/// @file Config.h
/// @brief Configuration structure for SDS011 driver
#pragma once

#include <cstddef>
#include <cstdint>
#include "SDS011/Status.h"

namespace SDS011 {

/// Serial write callback signature
/// @param data      Frame to write (always 19 bytes)
/// @param len       Number of bytes to write
/// @param written   Out: number of bytes the transport accepted
/// @param timeoutMs Maximum time to wait for completion
/// @param user      User context pointer passed through from Config
/// @return Status indicating success or failure. A transport that accepts
///         fewer than len bytes returns OK with written < len; the driver
///         reports that as Err::SHORT_WRITE.
using SerialWriteFn = Status (*)(const uint8_t* data, size_t len, size_t& written,
                                 uint32_t timeoutMs, void* user);

/// Serial read callback signature
/// @param data      Buffer for received bytes
/// @param len       Number of bytes requested (always 10)
/// @param received  Out: number of bytes stored in data
/// @param timeoutMs Maximum time to block waiting for len bytes
/// @param user      User context pointer passed through from Config
/// @return Status indicating success or failure. End of stream or a timeout
///         with partial data is reported as OK with received < len.
using SerialReadFn = Status (*)(uint8_t* data, size_t len, size_t& received,
                                uint32_t timeoutMs, void* user);

/// Optional callback reporting bytes buffered by the transport
/// @param user User context pointer passed through from Config
/// @return Number of bytes that can be read without blocking
/// @note Required only by the cooperative (tick-driven) API.
using SerialAvailableFn = size_t (*)(void* user);

/// Millisecond delay callback
/// @param ms   Time to wait in milliseconds
/// @param user User context pointer passed through from Delay
using DelayMsFn = void (*)(uint32_t ms, void* user);

/// Delay provider handed to every blocking operation
struct Delay {
  DelayMsFn delayMs = nullptr;  ///< Wait function (required)
  void* user = nullptr;         ///< User context for delayMs
};

/// Configuration for SDS011 driver
struct Config {
  // === Serial Transport (required) ===
  SerialWriteFn serialWrite = nullptr;          ///< Serial write function pointer
  SerialReadFn serialRead = nullptr;            ///< Serial read function pointer
  SerialAvailableFn serialAvailable = nullptr;  ///< Optional, cooperative API only
  void* serialUser = nullptr;                   ///< User context for callbacks

  /// Per-transfer serial timeout in ms (read and write)
  uint32_t serialTimeoutMs = 1000;

  // === Timing ===
  /// Settle time before waking a sleeping sensor
  uint32_t sleepDelayMs = 500;

  /// Fan spin-up time between wake and the measurement that is kept.
  /// The sensor manual recommends 30 seconds.
  uint32_t measureDelayMs = 30000;
};

} // namespace SDS011
