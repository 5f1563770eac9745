/// @file Frame.h
/// @brief Byte-level codec for SDS011 query and reply frames
#pragma once

#include <cstddef>
#include <cstdint>
#include "SDS011/Status.h"
#include "SDS011/CommandTable.h"
#include "SDS011/Message.h"

namespace SDS011 {
namespace frame {

using QueryFrame = uint8_t[cmd::QUERY_FRAME_LEN];
using ReplyFrame = uint8_t[cmd::REPLY_FRAME_LEN];

/// Wrapping 8-bit sum of len bytes
uint8_t checksum(const uint8_t* data, size_t len);

/// Build a 19-byte query frame
/// @param msg      Request to encode (its deviceId is ignored)
/// @param targetId Addressed sensor, cmd::BROADCAST_ID for all sensors
/// @param out      Destination frame; every byte is written
/// @note Pure; ranges are checked by validate(), not here.
void encodeQuery(const Message& msg, uint16_t targetId, QueryFrame& out);

/// Build a 10-byte reply frame as the sensor would send it
/// @param msg Reply to encode; msg.deviceId is written as sender id
///            (msg.newDeviceId for Kind::DEVICE_ID)
/// @param out Destination frame; every byte is written
void encodeReply(const Message& msg, ReplyFrame& out);

/// Decode and validate a 10-byte reply frame
/// @param in  Raw frame
/// @param out Decoded message, written only on success
/// @return OK, or one of CHECKSUM_MISMATCH, UNKNOWN_COMMAND,
///         UNKNOWN_SUBCOMMAND, INVALID_BOOLEAN_FIELD, INVALID_TIME_FIELD,
///         FRAME_FORMAT
Status decodeReply(const ReplyFrame& in, Message& out);

/// Check the documented tail-byte exceptions
/// @return true if a reply with this command/subcommand/access may end in tail
bool isTailException(uint8_t command, uint8_t subcommand, uint8_t access, uint8_t tail);

} // namespace frame
} // namespace SDS011
