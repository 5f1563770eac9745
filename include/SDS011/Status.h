/// @file Status.h
/// @brief Error codes and status handling for SDS011 driver
#pragma once

#include <cstdint>

namespace SDS011 {

/// Error codes for all SDS011 operations
enum class Err : uint8_t {
  OK = 0,                 ///< Operation successful
  INVALID_CONFIG,         ///< Missing callback or invalid configuration value
  INVALID_PARAM,          ///< Caller-supplied value outside protocol range
  TIMEOUT,                ///< Reply did not arrive in time (cooperative API)
  BUSY,                   ///< Another sequence is pending
  IN_PROGRESS,            ///< Sequence scheduled; call tick() to complete
  MEASUREMENT_NOT_READY,  ///< No completed measurement to hand out
  UNSUPPORTED,            ///< Operation not supported (missing callback)
  SERIAL_READ_ERROR,      ///< Transport reported a read failure
  SERIAL_WRITE_ERROR,     ///< Transport reported a write failure
  SHORT_READ,             ///< Fewer than 10 bytes received (end of stream)
  SHORT_WRITE,            ///< Transport accepted fewer than 19 bytes
  CHECKSUM_MISMATCH,      ///< Reply checksum invalid (detail = computed << 8 | expected)
  FRAME_FORMAT,           ///< Bad head/tail byte (detail = offending byte)
  UNKNOWN_COMMAND,        ///< Unknown reply command id (detail = byte)
  UNKNOWN_SUBCOMMAND,     ///< Unknown reply subcommand (detail = byte)
  INVALID_BOOLEAN_FIELD,  ///< Boolean-coded field outside {0,1} (detail = byte)
  INVALID_TIME_FIELD,     ///< Working period above 30 minutes (detail = byte)
  UNEXPECTED_REPLY,       ///< Reply decoded but not the kind that was requested
  OPERATION_FAILED        ///< Reply confirms a different mode/value than requested
};

/// @return true for the codes produced by frame decoding
inline constexpr bool isParseError(Err code) {
  return code == Err::CHECKSUM_MISMATCH || code == Err::FRAME_FORMAT ||
         code == Err::UNKNOWN_COMMAND || code == Err::UNKNOWN_SUBCOMMAND ||
         code == Err::INVALID_BOOLEAN_FIELD || code == Err::INVALID_TIME_FIELD;
}

/// Status structure returned by all fallible operations
struct Status {
  Err code = Err::OK;
  int32_t detail = 0;        ///< Implementation-specific detail (e.g., offending byte)
  const char* msg = "";      ///< Static string describing the error

  constexpr Status() = default;
  constexpr Status(Err c, int32_t d, const char* m) : code(c), detail(d), msg(m) {}

  /// @return true if operation succeeded
  constexpr bool ok() const { return code == Err::OK; }

  /// Create a success status
  static constexpr Status Ok() { return Status{Err::OK, 0, "OK"}; }

  /// Create an error status
  static constexpr Status Error(Err err, const char* message, int32_t detailCode = 0) {
    return Status{err, detailCode, message};
  }
};

} // namespace SDS011
