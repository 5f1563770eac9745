/**
 * @file Frame.cpp
 * @brief SDS011 frame codec implementation.
 */

#include "SDS011/Frame.h"

#include <cstring>

namespace SDS011 {
namespace frame {
namespace {

static uint16_t readBe16(const uint8_t* p) {
  return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

static uint16_t readLe16(const uint8_t* p) {
  return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static void writeBe16(uint8_t* p, uint16_t value) {
  p[0] = static_cast<uint8_t>(value >> 8);
  p[1] = static_cast<uint8_t>(value & 0xFF);
}

static void writeLe16(uint8_t* p, uint16_t value) {
  p[0] = static_cast<uint8_t>(value & 0xFF);
  p[1] = static_cast<uint8_t>(value >> 8);
}

static Status parseBoolean(uint8_t raw, uint8_t& out) {
  if (raw > 1) {
    return Status::Error(Err::INVALID_BOOLEAN_FIELD, "Boolean field out of range", raw);
  }
  out = raw;
  return Status::Ok();
}

static Status parseAccess(const ReplyFrame& in, Access& out) {
  uint8_t raw = 0;
  Status st = parseBoolean(in[cmd::OFF_ACCESS], raw);
  if (!st.ok()) {
    return st;
  }
  out = static_cast<Access>(raw);
  return Status::Ok();
}

static Status parseConfigReply(const ReplyFrame& in, Message& msg) {
  const uint8_t sub = in[cmd::OFF_SUBCOMMAND];
  uint8_t raw = 0;
  Status st = Status::Ok();

  switch (sub) {
    case cmd::SUB_REPORTING_MODE:
      msg.kind = Kind::REPORTING_MODE;
      st = parseAccess(in, msg.access);
      if (!st.ok()) {
        return st;
      }
      st = parseBoolean(in[cmd::OFF_VALUE], raw);
      if (!st.ok()) {
        return st;
      }
      msg.reportingMode = static_cast<ReportingMode>(raw);
      return Status::Ok();

    case cmd::SUB_DEVICE_ID:
      // The reply is sent from the newly assigned id.
      msg.kind = Kind::DEVICE_ID;
      msg.access = Access::SET;
      msg.newDeviceId = readBe16(&in[cmd::REPLY_OFF_DEVICE_ID]);
      return Status::Ok();

    case cmd::SUB_SLEEP_MODE:
      msg.kind = Kind::SLEEP_MODE;
      st = parseAccess(in, msg.access);
      if (!st.ok()) {
        return st;
      }
      st = parseBoolean(in[cmd::OFF_VALUE], raw);
      if (!st.ok()) {
        return st;
      }
      msg.sleepMode = static_cast<SleepMode>(raw);
      return Status::Ok();

    case cmd::SUB_FIRMWARE:
      msg.kind = Kind::FIRMWARE;
      msg.firmware.year = in[cmd::REPLY_OFF_FW_YEAR];
      msg.firmware.month = in[cmd::REPLY_OFF_FW_MONTH];
      msg.firmware.day = in[cmd::REPLY_OFF_FW_DAY];
      return Status::Ok();

    case cmd::SUB_WORKING_PERIOD:
      msg.kind = Kind::WORKING_PERIOD;
      st = parseAccess(in, msg.access);
      if (!st.ok()) {
        return st;
      }
      if (in[cmd::OFF_VALUE] > cmd::MAX_WORKING_PERIOD_MIN) {
        return Status::Error(Err::INVALID_TIME_FIELD, "Working period out of range",
                             in[cmd::OFF_VALUE]);
      }
      msg.periodMinutes = in[cmd::OFF_VALUE];
      return Status::Ok();

    default:
      return Status::Error(Err::UNKNOWN_SUBCOMMAND, "Unknown subcommand", sub);
  }
}

}  // namespace

uint8_t checksum(const uint8_t* data, size_t len) {
  uint8_t sum = 0;
  for (size_t i = 0; i < len; ++i) {
    sum = static_cast<uint8_t>(sum + data[i]);
  }
  return sum;
}

void encodeQuery(const Message& msg, uint16_t targetId, QueryFrame& out) {
  std::memset(out, 0, sizeof(out));
  out[cmd::OFF_HEAD] = cmd::FRAME_HEAD;
  out[cmd::OFF_COMMAND] = cmd::CMD_QUERY;
  out[cmd::OFF_SUBCOMMAND] = static_cast<uint8_t>(msg.kind);

  switch (msg.kind) {
    case Kind::REPORTING_MODE:
      out[cmd::OFF_ACCESS] = static_cast<uint8_t>(msg.access);
      out[cmd::OFF_VALUE] = static_cast<uint8_t>(msg.reportingMode);
      break;
    case Kind::SLEEP_MODE:
      out[cmd::OFF_ACCESS] = static_cast<uint8_t>(msg.access);
      out[cmd::OFF_VALUE] = static_cast<uint8_t>(msg.sleepMode);
      break;
    case Kind::WORKING_PERIOD:
      out[cmd::OFF_ACCESS] = static_cast<uint8_t>(msg.access);
      out[cmd::OFF_VALUE] = msg.periodMinutes;
      break;
    case Kind::DEVICE_ID:
      writeBe16(&out[cmd::QUERY_OFF_NEW_ID], msg.newDeviceId);
      break;
    case Kind::MEASUREMENT:
    case Kind::FIRMWARE:
    default:
      break;
  }

  writeBe16(&out[cmd::QUERY_OFF_TARGET_ID], targetId);
  out[cmd::QUERY_OFF_CHECKSUM] =
      checksum(&out[cmd::QUERY_CHECKSUM_BEGIN],
               cmd::QUERY_CHECKSUM_END - cmd::QUERY_CHECKSUM_BEGIN);
  out[cmd::QUERY_OFF_TAIL] = cmd::FRAME_TAIL;
}

void encodeReply(const Message& msg, ReplyFrame& out) {
  std::memset(out, 0, sizeof(out));
  out[cmd::OFF_HEAD] = cmd::FRAME_HEAD;
  uint16_t senderId = msg.deviceId;

  if (msg.kind == Kind::MEASUREMENT) {
    out[cmd::OFF_COMMAND] = cmd::CMD_REPLY_MEASUREMENT;
    writeLe16(&out[cmd::REPLY_OFF_PM25], msg.measurement.pm25_x10);
    writeLe16(&out[cmd::REPLY_OFF_PM10], msg.measurement.pm10_x10);
  } else {
    out[cmd::OFF_COMMAND] = cmd::CMD_REPLY_CONFIG;
    out[cmd::OFF_SUBCOMMAND] = static_cast<uint8_t>(msg.kind);
    switch (msg.kind) {
      case Kind::REPORTING_MODE:
        out[cmd::OFF_ACCESS] = static_cast<uint8_t>(msg.access);
        out[cmd::OFF_VALUE] = static_cast<uint8_t>(msg.reportingMode);
        break;
      case Kind::SLEEP_MODE:
        out[cmd::OFF_ACCESS] = static_cast<uint8_t>(msg.access);
        out[cmd::OFF_VALUE] = static_cast<uint8_t>(msg.sleepMode);
        break;
      case Kind::WORKING_PERIOD:
        out[cmd::OFF_ACCESS] = static_cast<uint8_t>(msg.access);
        out[cmd::OFF_VALUE] = msg.periodMinutes;
        break;
      case Kind::FIRMWARE:
        out[cmd::REPLY_OFF_FW_YEAR] = msg.firmware.year;
        out[cmd::REPLY_OFF_FW_MONTH] = msg.firmware.month;
        out[cmd::REPLY_OFF_FW_DAY] = msg.firmware.day;
        break;
      case Kind::DEVICE_ID:
        senderId = msg.newDeviceId;
        break;
      default:
        break;
    }
  }

  writeBe16(&out[cmd::REPLY_OFF_DEVICE_ID], senderId);
  out[cmd::REPLY_OFF_CHECKSUM] =
      checksum(&out[cmd::REPLY_CHECKSUM_BEGIN],
               cmd::REPLY_CHECKSUM_END - cmd::REPLY_CHECKSUM_BEGIN);
  out[cmd::REPLY_OFF_TAIL] = cmd::FRAME_TAIL;
}

Status decodeReply(const ReplyFrame& in, Message& out) {
  const uint8_t computed = checksum(&in[cmd::REPLY_CHECKSUM_BEGIN],
                                    cmd::REPLY_CHECKSUM_END - cmd::REPLY_CHECKSUM_BEGIN);
  const uint8_t expected = in[cmd::REPLY_OFF_CHECKSUM];
  if (computed != expected) {
    return Status::Error(Err::CHECKSUM_MISMATCH, "Checksum mismatch",
                         static_cast<int32_t>((computed << 8) | expected));
  }

  Message msg;
  const uint8_t command = in[cmd::OFF_COMMAND];
  if (command == cmd::CMD_REPLY_MEASUREMENT) {
    msg.kind = Kind::MEASUREMENT;
    msg.measurement.pm25_x10 = readLe16(&in[cmd::REPLY_OFF_PM25]);
    msg.measurement.pm10_x10 = readLe16(&in[cmd::REPLY_OFF_PM10]);
  } else if (command == cmd::CMD_REPLY_CONFIG) {
    Status st = parseConfigReply(in, msg);
    if (!st.ok()) {
      return st;
    }
  } else {
    return Status::Error(Err::UNKNOWN_COMMAND, "Unknown command", command);
  }

  msg.deviceId = readBe16(&in[cmd::REPLY_OFF_DEVICE_ID]);

  if (in[cmd::OFF_HEAD] != cmd::FRAME_HEAD) {
    return Status::Error(Err::FRAME_FORMAT, "Bad head byte", in[cmd::OFF_HEAD]);
  }
  const uint8_t tail = in[cmd::REPLY_OFF_TAIL];
  if (tail != cmd::FRAME_TAIL &&
      !isTailException(command, in[cmd::OFF_SUBCOMMAND], in[cmd::OFF_ACCESS], tail)) {
    return Status::Error(Err::FRAME_FORMAT, "Bad tail byte", tail);
  }

  out = msg;
  return Status::Ok();
}

bool isTailException(uint8_t command, uint8_t subcommand, uint8_t access, uint8_t tail) {
  for (const cmd::TailException& ex : cmd::TAIL_EXCEPTIONS) {
    if (ex.command == command && ex.subcommand == subcommand &&
        ex.access == access && ex.tail == tail) {
      return true;
    }
  }
  return false;
}

} // namespace frame
} // namespace SDS011
