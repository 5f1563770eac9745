/**
 * @file Message.cpp
 * @brief SDS011 message catalogue.
 */

#include "SDS011/Message.h"

#include <cstdio>

namespace SDS011 {

size_t FirmwareVersion::format(char* buf, size_t len) const {
  if (buf == nullptr || len == 0) {
    return 0;
  }

  const int n = std::snprintf(buf, len, "%u.%02u.%02u",
                              static_cast<unsigned>(displayYear()),
                              static_cast<unsigned>(month),
                              static_cast<unsigned>(day));
  if (n < 0 || static_cast<size_t>(n) >= len) {
    buf[0] = '\0';
    return 0;
  }
  return static_cast<size_t>(n);
}

Message Message::queryMeasurement() {
  Message msg;
  msg.kind = Kind::MEASUREMENT;
  return msg;
}

Message Message::queryReportingMode() {
  Message msg;
  msg.kind = Kind::REPORTING_MODE;
  msg.access = Access::QUERY;
  return msg;
}

Message Message::setReportingMode(ReportingMode mode) {
  Message msg;
  msg.kind = Kind::REPORTING_MODE;
  msg.access = Access::SET;
  msg.reportingMode = mode;
  return msg;
}

Message Message::querySleepMode() {
  Message msg;
  msg.kind = Kind::SLEEP_MODE;
  msg.access = Access::QUERY;
  return msg;
}

Message Message::setSleepMode(SleepMode mode) {
  Message msg;
  msg.kind = Kind::SLEEP_MODE;
  msg.access = Access::SET;
  msg.sleepMode = mode;
  return msg;
}

Message Message::queryWorkingPeriod() {
  Message msg;
  msg.kind = Kind::WORKING_PERIOD;
  msg.access = Access::QUERY;
  return msg;
}

Message Message::setWorkingPeriod(uint8_t minutes) {
  Message msg;
  msg.kind = Kind::WORKING_PERIOD;
  msg.access = Access::SET;
  msg.periodMinutes = minutes;
  return msg;
}

Message Message::queryFirmware() {
  Message msg;
  msg.kind = Kind::FIRMWARE;
  return msg;
}

Message Message::setDeviceId(uint16_t newId) {
  Message msg;
  msg.kind = Kind::DEVICE_ID;
  msg.access = Access::SET;
  msg.newDeviceId = newId;
  return msg;
}

Status validate(const Message& msg) {
  switch (msg.kind) {
    case Kind::WORKING_PERIOD:
      if (msg.periodMinutes > cmd::MAX_WORKING_PERIOD_MIN) {
        return Status::Error(Err::INVALID_PARAM, "Working period above 30 minutes",
                             msg.periodMinutes);
      }
      break;
    case Kind::DEVICE_ID:
      if (msg.newDeviceId == cmd::BROADCAST_ID) {
        return Status::Error(Err::INVALID_PARAM, "Broadcast id cannot be assigned",
                             msg.newDeviceId);
      }
      break;
    default:
      break;
  }
  return Status::Ok();
}

const char* kindName(Kind kind) {
  switch (kind) {
    case Kind::REPORTING_MODE: return "REPORTING_MODE";
    case Kind::MEASUREMENT: return "MEASUREMENT";
    case Kind::DEVICE_ID: return "DEVICE_ID";
    case Kind::SLEEP_MODE: return "SLEEP_MODE";
    case Kind::FIRMWARE: return "FIRMWARE";
    case Kind::WORKING_PERIOD: return "WORKING_PERIOD";
    default: return "UNKNOWN";
  }
}

} // namespace SDS011
