/// @file Log.h
/// @brief Serial console logging for examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>

/// Open the console and wait briefly for a USB host
inline void log_begin(uint32_t baud) {
  Serial.begin(baud);
  const uint32_t start = millis();
  while (!Serial && (millis() - start) < 2000) {
    delay(10);
  }
}

#define LOGI(fmt, ...) Serial.printf("[I %lu] " fmt "\n", static_cast<unsigned long>(millis()), ##__VA_ARGS__)
#define LOGW(fmt, ...) Serial.printf("[W %lu] " fmt "\n", static_cast<unsigned long>(millis()), ##__VA_ARGS__)
#define LOGE(fmt, ...) Serial.printf("[E %lu] " fmt "\n", static_cast<unsigned long>(millis()), ##__VA_ARGS__)
