/// @file CommandTable.h
/// @brief Frame layout and command definitions for SDS011
#pragma once

#include <cstdint>
#include <cstddef>

namespace SDS011 {
namespace cmd {

// ============================================================================
// Frame delimiters
// ============================================================================

static constexpr uint8_t FRAME_HEAD = 0xAA;
static constexpr uint8_t FRAME_TAIL = 0xAB;

// Set-sleep replies end with 0xFF on real hardware
static constexpr uint8_t SLEEP_SET_REPLY_TAIL = 0xFF;

// ============================================================================
// Command ids
// ============================================================================

static constexpr uint8_t CMD_QUERY = 0xB4;              // host -> sensor, all queries
static constexpr uint8_t CMD_REPLY_MEASUREMENT = 0xC0;  // sensor -> host, data frame
static constexpr uint8_t CMD_REPLY_CONFIG = 0xC5;       // sensor -> host, command reply

// ============================================================================
// Subcommands (byte 2)
// ============================================================================

static constexpr uint8_t SUB_REPORTING_MODE = 0x02;
static constexpr uint8_t SUB_MEASUREMENT = 0x04;
static constexpr uint8_t SUB_DEVICE_ID = 0x05;
static constexpr uint8_t SUB_SLEEP_MODE = 0x06;
static constexpr uint8_t SUB_FIRMWARE = 0x07;
static constexpr uint8_t SUB_WORKING_PERIOD = 0x08;

// ============================================================================
// Frame lengths and offsets
// ============================================================================

static constexpr size_t REPLY_FRAME_LEN = 10;
static constexpr size_t QUERY_FRAME_LEN = 19;

static constexpr size_t OFF_HEAD = 0;
static constexpr size_t OFF_COMMAND = 1;
static constexpr size_t OFF_SUBCOMMAND = 2;
static constexpr size_t OFF_ACCESS = 3;   // query/set flag
static constexpr size_t OFF_VALUE = 4;    // mode / period byte

// Reply
static constexpr size_t REPLY_OFF_PM25 = 2;      // u16 LE, tenths of ug/m3
static constexpr size_t REPLY_OFF_PM10 = 4;      // u16 LE, tenths of ug/m3
static constexpr size_t REPLY_OFF_FW_YEAR = 3;
static constexpr size_t REPLY_OFF_FW_MONTH = 4;
static constexpr size_t REPLY_OFF_FW_DAY = 5;
static constexpr size_t REPLY_OFF_DEVICE_ID = 6; // u16 BE
static constexpr size_t REPLY_OFF_CHECKSUM = 8;
static constexpr size_t REPLY_OFF_TAIL = 9;
static constexpr size_t REPLY_CHECKSUM_BEGIN = 2;
static constexpr size_t REPLY_CHECKSUM_END = 8;  // exclusive

// Query
static constexpr size_t QUERY_OFF_NEW_ID = 13;   // u16 BE
static constexpr size_t QUERY_OFF_TARGET_ID = 15; // u16 BE
static constexpr size_t QUERY_OFF_CHECKSUM = 17;
static constexpr size_t QUERY_OFF_TAIL = 18;
static constexpr size_t QUERY_CHECKSUM_BEGIN = 2;
static constexpr size_t QUERY_CHECKSUM_END = 17;  // exclusive

// ============================================================================
// Field values
// ============================================================================

static constexpr uint16_t BROADCAST_ID = 0xFFFF;
static constexpr uint8_t MAX_WORKING_PERIOD_MIN = 30;
static constexpr uint16_t FIRMWARE_YEAR_BASE = 2000;

// ============================================================================
// Tail-byte exceptions
// ============================================================================

/// Reply shape that may carry a non-standard tail byte
struct TailException {
  uint8_t command;
  uint8_t subcommand;
  uint8_t access;
  uint8_t tail;
};

static constexpr TailException TAIL_EXCEPTIONS[] = {
    {CMD_REPLY_CONFIG, SUB_SLEEP_MODE, 1 /* set */, SLEEP_SET_REPLY_TAIL},
};

} // namespace cmd
} // namespace SDS011
