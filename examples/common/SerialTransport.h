/// @file SerialTransport.h
/// @brief HardwareSerial transport adapter for examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>
#include <HardwareSerial.h>
#include "SDS011/Status.h"

namespace transport {

using SDS011::Status;
using SDS011::Err;

/// Initialize a UART for the sensor (9600 8N1)
/// @param port UART instance
/// @param rx   RX pin (sensor TXD)
/// @param tx   TX pin (sensor RXD)
/// @param baud Baud rate
/// @return true if initialized
inline bool initSerial(HardwareSerial& port, int rx, int tx, uint32_t baud) {
  port.begin(baud, SERIAL_8N1, rx, tx);
  return true;
}

/// Drop bytes buffered by the UART.
/// A sensor left in active mode pushes a frame every second; stale bytes
/// would shift every later reply.
inline size_t drainInput(HardwareSerial& port) {
  size_t dropped = 0;
  while (port.available() > 0) {
    port.read();
    dropped++;
  }
  return dropped;
}

/// Serial write callback
/// @param user HardwareSerial* passed through Config::serialUser
inline Status uartWrite(const uint8_t* data, size_t len, size_t& written,
                        uint32_t timeoutMs, void* user) {
  (void)timeoutMs;
  written = 0;
  auto* port = static_cast<HardwareSerial*>(user);
  if (port == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "UART not set");
  }

  written = port->write(data, len);
  port->flush();
  return Status::Ok();
}

/// Serial read callback. Blocks up to timeoutMs for len bytes.
/// A timeout is reported as OK with received < len.
inline Status uartRead(uint8_t* data, size_t len, size_t& received,
                       uint32_t timeoutMs, void* user) {
  received = 0;
  auto* port = static_cast<HardwareSerial*>(user);
  if (port == nullptr) {
    return Status::Error(Err::INVALID_CONFIG, "UART not set");
  }

  port->setTimeout(timeoutMs);
  received = port->readBytes(data, len);
  return Status::Ok();
}

/// Bytes buffered by the UART (cooperative API)
inline size_t uartAvailable(void* user) {
  auto* port = static_cast<HardwareSerial*>(user);
  if (port == nullptr) {
    return 0;
  }
  const int n = port->available();
  return (n > 0) ? static_cast<size_t>(n) : 0;
}

/// Delay provider for blocking operations
inline void delayMs(uint32_t ms, void* user) {
  (void)user;
  delay(ms);
}

}  // namespace transport
