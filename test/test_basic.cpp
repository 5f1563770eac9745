/// @file test_basic.cpp
/// @brief Unit tests for SDS011 status, catalogue and frame codec

#include <unity.h>

#include <cstdio>
#include <cstring>

#include "SDS011/SDS011.h"
#include "SDS011/Frame.h"

using namespace SDS011;

// ============================================================================
// Test Helpers
// ============================================================================

void setUp() {}
void tearDown() {}

static void refreshChecksum(uint8_t* reply) {
  reply[cmd::REPLY_OFF_CHECKSUM] =
      frame::checksum(&reply[cmd::REPLY_CHECKSUM_BEGIN],
                      cmd::REPLY_CHECKSUM_END - cmd::REPLY_CHECKSUM_BEGIN);
}

static const uint8_t FIRMWARE_REPLY[10] = {
    0xAA, 0xC5, 0x07, 0x0F, 0x07, 0x0A, 0xA1, 0x60, 0x28, 0xAB};

static const uint8_t MEASUREMENT_REPLY[10] = {
    0xAA, 0xC0, 0xD4, 0x04, 0x3A, 0x0A, 0xA1, 0x60, 0x1D, 0xAB};

// ============================================================================
// Status and Config
// ============================================================================

void test_status_ok() {
  Status st = Status::Ok();
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL(Err::OK, st.code);
}

void test_status_error() {
  Status st = Status::Error(Err::SHORT_READ, "Test error", 4);
  TEST_ASSERT_FALSE(st.ok());
  TEST_ASSERT_EQUAL(Err::SHORT_READ, st.code);
  TEST_ASSERT_EQUAL(4, st.detail);
  TEST_ASSERT_EQUAL_STRING("Test error", st.msg);
}

void test_status_in_progress() {
  Status st = Status{Err::IN_PROGRESS, 0, "In progress"};
  TEST_ASSERT_FALSE(st.ok());
  TEST_ASSERT_EQUAL(Err::IN_PROGRESS, st.code);
}

void test_parse_error_group() {
  TEST_ASSERT_TRUE(isParseError(Err::CHECKSUM_MISMATCH));
  TEST_ASSERT_TRUE(isParseError(Err::FRAME_FORMAT));
  TEST_ASSERT_TRUE(isParseError(Err::UNKNOWN_COMMAND));
  TEST_ASSERT_TRUE(isParseError(Err::UNKNOWN_SUBCOMMAND));
  TEST_ASSERT_TRUE(isParseError(Err::INVALID_BOOLEAN_FIELD));
  TEST_ASSERT_TRUE(isParseError(Err::INVALID_TIME_FIELD));
  TEST_ASSERT_FALSE(isParseError(Err::OK));
  TEST_ASSERT_FALSE(isParseError(Err::SHORT_READ));
  TEST_ASSERT_FALSE(isParseError(Err::UNEXPECTED_REPLY));
  TEST_ASSERT_FALSE(isParseError(Err::OPERATION_FAILED));
}

void test_config_defaults() {
  Config cfg;
  TEST_ASSERT_NULL(cfg.serialWrite);
  TEST_ASSERT_NULL(cfg.serialRead);
  TEST_ASSERT_NULL(cfg.serialAvailable);
  TEST_ASSERT_NULL(cfg.serialUser);
  TEST_ASSERT_EQUAL_UINT32(1000u, cfg.serialTimeoutMs);
  TEST_ASSERT_EQUAL_UINT32(500u, cfg.sleepDelayMs);
  TEST_ASSERT_EQUAL_UINT32(30000u, cfg.measureDelayMs);

  Delay delay;
  TEST_ASSERT_NULL(delay.delayMs);
  TEST_ASSERT_NULL(delay.user);
}

void test_version_string() {
  char expected[16] = {};
  std::snprintf(expected, sizeof(expected), "%u.%u.%u",
                static_cast<unsigned>(VERSION_MAJOR),
                static_cast<unsigned>(VERSION_MINOR),
                static_cast<unsigned>(VERSION_PATCH));
  TEST_ASSERT_EQUAL_STRING(expected, VERSION);
}

// ============================================================================
// Catalogue
// ============================================================================

void test_firmware_format() {
  FirmwareVersion fw;
  fw.year = 15;
  fw.month = 7;
  fw.day = 10;
  TEST_ASSERT_EQUAL_UINT16(2015, fw.displayYear());

  char buf[16] = {};
  TEST_ASSERT_EQUAL(10, fw.format(buf, sizeof(buf)));
  TEST_ASSERT_EQUAL_STRING("2015.07.10", buf);

  char small[8] = {'x'};
  TEST_ASSERT_EQUAL(0, fw.format(small, sizeof(small)));
  TEST_ASSERT_EQUAL_UINT8(0, small[0]);
}

void test_measurement_units() {
  Measurement m;
  m.pm25_x10 = 1236;
  m.pm10_x10 = 2618;
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 123.6f, m.pm25());
  TEST_ASSERT_FLOAT_WITHIN(0.001f, 261.8f, m.pm10());
}

void test_validate_ranges() {
  TEST_ASSERT_TRUE(validate(Message::setWorkingPeriod(0)).ok());
  TEST_ASSERT_TRUE(validate(Message::setWorkingPeriod(30)).ok());

  Status st = validate(Message::setWorkingPeriod(31));
  TEST_ASSERT_EQUAL(Err::INVALID_PARAM, st.code);
  TEST_ASSERT_EQUAL(31, st.detail);

  TEST_ASSERT_TRUE(validate(Message::setDeviceId(0xA001)).ok());
  TEST_ASSERT_EQUAL(Err::INVALID_PARAM, validate(Message::setDeviceId(0xFFFF)).code);

  TEST_ASSERT_TRUE(validate(Message::queryMeasurement()).ok());
  TEST_ASSERT_TRUE(validate(Message::setSleepMode(SleepMode::WORK)).ok());
}

void test_kind_names() {
  TEST_ASSERT_EQUAL_STRING("MEASUREMENT", kindName(Kind::MEASUREMENT));
  TEST_ASSERT_EQUAL_STRING("SLEEP_MODE", kindName(Kind::SLEEP_MODE));
  TEST_ASSERT_EQUAL_STRING("WORKING_PERIOD", kindName(Kind::WORKING_PERIOD));
}

// ============================================================================
// Checksum
// ============================================================================

void test_checksum_wraps() {
  const uint8_t data[4] = {0xFF, 0x02, 0x80, 0x80};
  TEST_ASSERT_EQUAL_HEX8(0x01, frame::checksum(data, sizeof(data)));
  TEST_ASSERT_EQUAL_HEX8(0x00, frame::checksum(data, 0));
}

void test_decode_succeeds_only_with_matching_checksum() {
  uint8_t reply[10];
  for (unsigned value = 0; value < 256; ++value) {
    std::memcpy(reply, MEASUREMENT_REPLY, sizeof(reply));
    reply[cmd::REPLY_OFF_CHECKSUM] = static_cast<uint8_t>(value);

    Message msg;
    Status st = frame::decodeReply(reply, msg);
    if (value == 0x1D) {
      TEST_ASSERT_TRUE(st.ok());
    } else {
      TEST_ASSERT_EQUAL(Err::CHECKSUM_MISMATCH, st.code);
      TEST_ASSERT_EQUAL_INT32((0x1D << 8) | static_cast<int32_t>(value), st.detail);
    }
  }
}

// ============================================================================
// Decode
// ============================================================================

void test_decode_firmware_literal() {
  Message msg;
  Status st = frame::decodeReply(FIRMWARE_REPLY, msg);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL(Kind::FIRMWARE, msg.kind);
  TEST_ASSERT_EQUAL_UINT8(15, msg.firmware.year);
  TEST_ASSERT_EQUAL_UINT8(7, msg.firmware.month);
  TEST_ASSERT_EQUAL_UINT8(10, msg.firmware.day);
  TEST_ASSERT_EQUAL_HEX16(0xA160, msg.deviceId);

  char buf[16] = {};
  msg.firmware.format(buf, sizeof(buf));
  TEST_ASSERT_EQUAL_STRING("2015.07.10", buf);
}

void test_decode_measurement_literal() {
  Message msg;
  Status st = frame::decodeReply(MEASUREMENT_REPLY, msg);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL(Kind::MEASUREMENT, msg.kind);
  TEST_ASSERT_EQUAL_UINT16(1236, msg.measurement.pm25_x10);
  TEST_ASSERT_EQUAL_UINT16(2618, msg.measurement.pm10_x10);
  TEST_ASSERT_EQUAL_HEX16(0xA160, msg.deviceId);
}

void test_decode_failure_leaves_output_untouched() {
  uint8_t reply[10];
  std::memcpy(reply, MEASUREMENT_REPLY, sizeof(reply));
  reply[cmd::REPLY_OFF_PM25] ^= 0x01;

  Message msg;
  msg.kind = Kind::FIRMWARE;
  msg.deviceId = 0x1234;
  Status st = frame::decodeReply(reply, msg);
  TEST_ASSERT_EQUAL(Err::CHECKSUM_MISMATCH, st.code);
  TEST_ASSERT_EQUAL(Kind::FIRMWARE, msg.kind);
  TEST_ASSERT_EQUAL_HEX16(0x1234, msg.deviceId);
}

void test_decode_working_period_bounds() {
  const uint8_t periods[3] = {0, 30, 31};
  for (uint8_t minutes : periods) {
    uint8_t reply[10] = {0xAA, 0xC5, 0x08, 0x01, minutes, 0x00, 0xA1, 0x60, 0x00, 0xAB};
    refreshChecksum(reply);

    Message msg;
    Status st = frame::decodeReply(reply, msg);
    if (minutes <= 30) {
      TEST_ASSERT_TRUE(st.ok());
      TEST_ASSERT_EQUAL(Kind::WORKING_PERIOD, msg.kind);
      TEST_ASSERT_EQUAL(Access::SET, msg.access);
      TEST_ASSERT_EQUAL_UINT8(minutes, msg.periodMinutes);
    } else {
      TEST_ASSERT_EQUAL(Err::INVALID_TIME_FIELD, st.code);
      TEST_ASSERT_EQUAL(31, st.detail);
    }
  }
}

void test_decode_invalid_boolean_fields() {
  // Reporting mode value
  uint8_t reply[10] = {0xAA, 0xC5, 0x02, 0x01, 0x02, 0x00, 0xA1, 0x60, 0x00, 0xAB};
  refreshChecksum(reply);
  Message msg;
  Status st = frame::decodeReply(reply, msg);
  TEST_ASSERT_EQUAL(Err::INVALID_BOOLEAN_FIELD, st.code);
  TEST_ASSERT_EQUAL(2, st.detail);

  // Sleep query/set flag
  uint8_t sleep[10] = {0xAA, 0xC5, 0x06, 0x03, 0x01, 0x00, 0xA1, 0x60, 0x00, 0xAB};
  refreshChecksum(sleep);
  st = frame::decodeReply(sleep, msg);
  TEST_ASSERT_EQUAL(Err::INVALID_BOOLEAN_FIELD, st.code);
  TEST_ASSERT_EQUAL(3, st.detail);

  // Sleep mode value
  sleep[cmd::OFF_ACCESS] = 0x00;
  sleep[cmd::OFF_VALUE] = 0x07;
  refreshChecksum(sleep);
  st = frame::decodeReply(sleep, msg);
  TEST_ASSERT_EQUAL(Err::INVALID_BOOLEAN_FIELD, st.code);
  TEST_ASSERT_EQUAL(7, st.detail);
}

void test_decode_unknown_command_and_subcommand() {
  uint8_t reply[10];
  std::memcpy(reply, MEASUREMENT_REPLY, sizeof(reply));
  reply[cmd::OFF_COMMAND] = 0xC1;
  Message msg;
  Status st = frame::decodeReply(reply, msg);
  TEST_ASSERT_EQUAL(Err::UNKNOWN_COMMAND, st.code);
  TEST_ASSERT_EQUAL(0xC1, st.detail);

  uint8_t config[10] = {0xAA, 0xC5, 0x09, 0x00, 0x00, 0x00, 0xA1, 0x60, 0x00, 0xAB};
  refreshChecksum(config);
  st = frame::decodeReply(config, msg);
  TEST_ASSERT_EQUAL(Err::UNKNOWN_SUBCOMMAND, st.code);
  TEST_ASSERT_EQUAL(0x09, st.detail);
}

void test_decode_bad_head_and_tail() {
  uint8_t reply[10];
  std::memcpy(reply, MEASUREMENT_REPLY, sizeof(reply));
  reply[cmd::OFF_HEAD] = 0xAB;
  Message msg;
  Status st = frame::decodeReply(reply, msg);
  TEST_ASSERT_EQUAL(Err::FRAME_FORMAT, st.code);
  TEST_ASSERT_EQUAL(0xAB, st.detail);

  std::memcpy(reply, MEASUREMENT_REPLY, sizeof(reply));
  reply[cmd::REPLY_OFF_TAIL] = 0xFF;
  st = frame::decodeReply(reply, msg);
  TEST_ASSERT_EQUAL(Err::FRAME_FORMAT, st.code);
  TEST_ASSERT_EQUAL(0xFF, st.detail);
}

void test_sleep_set_reply_tail_quirk() {
  uint8_t reply[10] = {0xAA, 0xC5, 0x06, 0x01, 0x00, 0x00, 0xA1, 0x60, 0x00, 0xFF};
  refreshChecksum(reply);

  Message msg;
  Status st = frame::decodeReply(reply, msg);
  TEST_ASSERT_TRUE(st.ok());
  TEST_ASSERT_EQUAL(Kind::SLEEP_MODE, msg.kind);
  TEST_ASSERT_EQUAL(Access::SET, msg.access);
  TEST_ASSERT_EQUAL(SleepMode::SLEEP, msg.sleepMode);
  TEST_ASSERT_TRUE(frame::isTailException(cmd::CMD_REPLY_CONFIG, cmd::SUB_SLEEP_MODE, 1, 0xFF));
}

void test_sleep_query_reply_tail_rejected() {
  uint8_t reply[10] = {0xAA, 0xC5, 0x06, 0x00, 0x01, 0x00, 0xA1, 0x60, 0x00, 0xFF};
  refreshChecksum(reply);

  Message msg;
  Status st = frame::decodeReply(reply, msg);
  TEST_ASSERT_EQUAL(Err::FRAME_FORMAT, st.code);
  TEST_ASSERT_FALSE(frame::isTailException(cmd::CMD_REPLY_CONFIG, cmd::SUB_SLEEP_MODE, 0, 0xFF));
  TEST_ASSERT_FALSE(
      frame::isTailException(cmd::CMD_REPLY_CONFIG, cmd::SUB_REPORTING_MODE, 1, 0xFF));
}

// ============================================================================
// Encode
// ============================================================================

void test_encode_measurement_query_broadcast() {
  const uint8_t expected[19] = {0xAA, 0xB4, 0x04, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                0x00, 0x00, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0x02, 0xAB};
  uint8_t out[19];
  frame::encodeQuery(Message::queryMeasurement(), cmd::BROADCAST_ID, out);
  TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, out, sizeof(expected));
}

void test_encode_set_query_mode() {
  const uint8_t expected[19] = {0xAA, 0xB4, 0x02, 0x01, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00,
                                0x00, 0x00, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0x02, 0xAB};
  uint8_t out[19];
  frame::encodeQuery(Message::setReportingMode(ReportingMode::QUERY), cmd::BROADCAST_ID, out);
  TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, out, sizeof(expected));
}

void test_encode_sleep_and_work() {
  uint8_t out[19];
  frame::encodeQuery(Message::setSleepMode(SleepMode::SLEEP), cmd::BROADCAST_ID, out);
  TEST_ASSERT_EQUAL_HEX8(0x06, out[cmd::OFF_SUBCOMMAND]);
  TEST_ASSERT_EQUAL_HEX8(0x01, out[cmd::OFF_ACCESS]);
  TEST_ASSERT_EQUAL_HEX8(0x00, out[cmd::OFF_VALUE]);
  TEST_ASSERT_EQUAL_HEX8(0x05, out[cmd::QUERY_OFF_CHECKSUM]);
  TEST_ASSERT_EQUAL_HEX8(0xAB, out[cmd::QUERY_OFF_TAIL]);

  frame::encodeQuery(Message::setSleepMode(SleepMode::WORK), cmd::BROADCAST_ID, out);
  TEST_ASSERT_EQUAL_HEX8(0x01, out[cmd::OFF_VALUE]);
  TEST_ASSERT_EQUAL_HEX8(0x06, out[cmd::QUERY_OFF_CHECKSUM]);
}

void test_encode_working_period_and_firmware() {
  uint8_t out[19];
  frame::encodeQuery(Message::setWorkingPeriod(5), cmd::BROADCAST_ID, out);
  TEST_ASSERT_EQUAL_HEX8(0x08, out[cmd::OFF_SUBCOMMAND]);
  TEST_ASSERT_EQUAL_HEX8(0x01, out[cmd::OFF_ACCESS]);
  TEST_ASSERT_EQUAL_HEX8(0x05, out[cmd::OFF_VALUE]);
  TEST_ASSERT_EQUAL_HEX8(
      frame::checksum(&out[cmd::QUERY_CHECKSUM_BEGIN],
                      cmd::QUERY_CHECKSUM_END - cmd::QUERY_CHECKSUM_BEGIN),
      out[cmd::QUERY_OFF_CHECKSUM]);

  frame::encodeQuery(Message::queryFirmware(), cmd::BROADCAST_ID, out);
  TEST_ASSERT_EQUAL_HEX8(0x07, out[cmd::OFF_SUBCOMMAND]);
  TEST_ASSERT_EQUAL_HEX8(0x00, out[cmd::OFF_ACCESS]);
  TEST_ASSERT_EQUAL_HEX8(0x05, out[cmd::QUERY_OFF_CHECKSUM]);
}

void test_encode_device_id_targeted() {
  const uint8_t expected[19] = {0xAA, 0xB4, 0x05, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                                0x00, 0x00, 0x00, 0xA0, 0x01, 0xA1, 0x60, 0xA7, 0xAB};
  uint8_t out[19];
  frame::encodeQuery(Message::setDeviceId(0xA001), 0xA160, out);
  TEST_ASSERT_EQUAL_HEX8_ARRAY(expected, out, sizeof(expected));
}

// ============================================================================
// Reply encoding
// ============================================================================

void test_reply_encoding_matches_literals() {
  Message fw = Message::queryFirmware();
  fw.firmware.year = 15;
  fw.firmware.month = 7;
  fw.firmware.day = 10;
  fw.deviceId = 0xA160;
  uint8_t out[10];
  frame::encodeReply(fw, out);
  TEST_ASSERT_EQUAL_HEX8_ARRAY(FIRMWARE_REPLY, out, sizeof(out));

  Message m = Message::queryMeasurement();
  m.measurement.pm25_x10 = 1236;
  m.measurement.pm10_x10 = 2618;
  m.deviceId = 0xA160;
  frame::encodeReply(m, out);
  TEST_ASSERT_EQUAL_HEX8_ARRAY(MEASUREMENT_REPLY, out, sizeof(out));
}

void test_reply_encoding_decodes_per_family() {
  Message requests[5] = {
      Message::setReportingMode(ReportingMode::ACTIVE),
      Message::querySleepMode(),
      Message::setWorkingPeriod(30),
      Message::queryWorkingPeriod(),
      Message::setDeviceId(0xBEEF)};
  requests[1].sleepMode = SleepMode::WORK;
  requests[3].periodMinutes = 12;

  for (Message& sent : requests) {
    sent.deviceId = 0x1234;
    uint8_t out[10];
    frame::encodeReply(sent, out);

    Message got;
    Status st = frame::decodeReply(out, got);
    TEST_ASSERT_TRUE(st.ok());
    TEST_ASSERT_EQUAL(sent.kind, got.kind);
    TEST_ASSERT_EQUAL(sent.access, got.access);
    switch (sent.kind) {
      case Kind::REPORTING_MODE:
        TEST_ASSERT_EQUAL(sent.reportingMode, got.reportingMode);
        TEST_ASSERT_EQUAL_HEX16(0x1234, got.deviceId);
        break;
      case Kind::SLEEP_MODE:
        TEST_ASSERT_EQUAL(sent.sleepMode, got.sleepMode);
        TEST_ASSERT_EQUAL_HEX16(0x1234, got.deviceId);
        break;
      case Kind::WORKING_PERIOD:
        TEST_ASSERT_EQUAL_UINT8(sent.periodMinutes, got.periodMinutes);
        TEST_ASSERT_EQUAL_HEX16(0x1234, got.deviceId);
        break;
      case Kind::DEVICE_ID:
        // Acknowledged from the new id
        TEST_ASSERT_EQUAL_HEX16(0xBEEF, got.newDeviceId);
        TEST_ASSERT_EQUAL_HEX16(0xBEEF, got.deviceId);
        break;
      default:
        TEST_FAIL_MESSAGE("unexpected kind");
    }
  }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
  (void)argc;
  (void)argv;
  UNITY_BEGIN();
  RUN_TEST(test_status_ok);
  RUN_TEST(test_status_error);
  RUN_TEST(test_status_in_progress);
  RUN_TEST(test_parse_error_group);
  RUN_TEST(test_config_defaults);
  RUN_TEST(test_version_string);
  RUN_TEST(test_firmware_format);
  RUN_TEST(test_measurement_units);
  RUN_TEST(test_validate_ranges);
  RUN_TEST(test_kind_names);
  RUN_TEST(test_checksum_wraps);
  RUN_TEST(test_decode_succeeds_only_with_matching_checksum);
  RUN_TEST(test_decode_firmware_literal);
  RUN_TEST(test_decode_measurement_literal);
  RUN_TEST(test_decode_failure_leaves_output_untouched);
  RUN_TEST(test_decode_working_period_bounds);
  RUN_TEST(test_decode_invalid_boolean_fields);
  RUN_TEST(test_decode_unknown_command_and_subcommand);
  RUN_TEST(test_decode_bad_head_and_tail);
  RUN_TEST(test_sleep_set_reply_tail_quirk);
  RUN_TEST(test_sleep_query_reply_tail_rejected);
  RUN_TEST(test_encode_measurement_query_broadcast);
  RUN_TEST(test_encode_set_query_mode);
  RUN_TEST(test_encode_sleep_and_work);
  RUN_TEST(test_encode_working_period_and_firmware);
  RUN_TEST(test_encode_device_id_targeted);
  RUN_TEST(test_reply_encoding_matches_literals);
  RUN_TEST(test_reply_encoding_decodes_per_family);
  return UNITY_END();
}
