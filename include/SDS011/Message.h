/// @file Message.h
/// @brief Typed payloads for every SDS011 command family
#pragma once

#include <cstddef>
#include <cstdint>
#include "SDS011/Status.h"
#include "SDS011/CommandTable.h"

namespace SDS011 {

/// Message family, valued by its subcommand byte
enum class Kind : uint8_t {
  REPORTING_MODE = cmd::SUB_REPORTING_MODE,
  MEASUREMENT = cmd::SUB_MEASUREMENT,
  DEVICE_ID = cmd::SUB_DEVICE_ID,
  SLEEP_MODE = cmd::SUB_SLEEP_MODE,
  FIRMWARE = cmd::SUB_FIRMWARE,
  WORKING_PERIOD = cmd::SUB_WORKING_PERIOD
};

/// Query/set sub-flag carried by configuration messages
enum class Access : uint8_t {
  QUERY = 0,  ///< Read current value
  SET = 1     ///< Change value
};

/// Reporting mode
enum class ReportingMode : uint8_t {
  ACTIVE = 0,  ///< Sensor pushes measurements on its own schedule
  QUERY = 1    ///< Sensor waits for explicit measurement queries
};

/// Sleep mode
enum class SleepMode : uint8_t {
  SLEEP = 0,  ///< Fan and laser off
  WORK = 1    ///< Fan and laser on
};

/// PM2.5 / PM10 sample
struct Measurement {
  uint16_t pm25_x10 = 0;  ///< PM2.5 in tenths of ug/m3
  uint16_t pm10_x10 = 0;  ///< PM10 in tenths of ug/m3

  /// PM2.5 in ug/m3
  float pm25() const { return static_cast<float>(pm25_x10) / 10.0f; }

  /// PM10 in ug/m3
  float pm10() const { return static_cast<float>(pm10_x10) / 10.0f; }
};

/// Firmware build date as reported by the sensor
struct FirmwareVersion {
  uint8_t year = 0;   ///< Years since 2000
  uint8_t month = 0;
  uint8_t day = 0;

  /// Four-digit year
  uint16_t displayYear() const {
    return static_cast<uint16_t>(cmd::FIRMWARE_YEAR_BASE + year);
  }

  /// Render as "YYYY.MM.DD"
  /// @return Characters written (excluding NUL), 0 if buf is too small
  size_t format(char* buf, size_t len) const;

  bool operator==(const FirmwareVersion& other) const {
    return year == other.year && month == other.month && day == other.day;
  }
  bool operator!=(const FirmwareVersion& other) const { return !(*this == other); }
};

/// One protocol message. Only the fields of the active kind are meaningful.
struct Message {
  Kind kind = Kind::MEASUREMENT;
  Access access = Access::QUERY;

  Measurement measurement;                          ///< Kind::MEASUREMENT
  ReportingMode reportingMode = ReportingMode::QUERY; ///< Kind::REPORTING_MODE
  SleepMode sleepMode = SleepMode::SLEEP;           ///< Kind::SLEEP_MODE
  uint8_t periodMinutes = 0;                        ///< Kind::WORKING_PERIOD
  FirmwareVersion firmware;                         ///< Kind::FIRMWARE
  uint16_t newDeviceId = 0;                         ///< Kind::DEVICE_ID

  /// Sender id of a decoded reply
  uint16_t deviceId = cmd::BROADCAST_ID;

  // Request builders
  static Message queryMeasurement();
  static Message queryReportingMode();
  static Message setReportingMode(ReportingMode mode);
  static Message querySleepMode();
  static Message setSleepMode(SleepMode mode);
  static Message queryWorkingPeriod();
  static Message setWorkingPeriod(uint8_t minutes);
  static Message queryFirmware();
  static Message setDeviceId(uint16_t newId);
};

/// Check a message against the protocol's value ranges
/// @return INVALID_PARAM for a working period above 30 minutes or a new
///         device id equal to the broadcast id, OK otherwise
Status validate(const Message& msg);

/// @return Static name of a message kind
const char* kindName(Kind kind);

} // namespace SDS011
