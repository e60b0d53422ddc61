#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Every message is a sequence of frames: a 32-bit big-endian length followed
// by that many payload bytes.
//
// Request:  "PING"
// Reply:    "OK"
//
// Request:  "COMPILE", client file name, source bytes, archive flag ("1" = archive attached, "0" = none),
//           archive bytes (empty when the flag is "0")
// Reply:    "SUCCESS", media type, artifact file name, artifact bytes
//        or "FAILURE", reason, exit code (decimal, empty if none), message, stdout, stderr
//        or "REJECTED", message
//
// Any request may also be answered by a single "UNKNOWN_COMMAND" or "SERVER_ERROR" frame.
namespace protocol {

constexpr auto CMD_PING = "PING";
constexpr auto CMD_COMPILE = "COMPILE";

constexpr auto REPLY_OK = "OK";
constexpr auto REPLY_SUCCESS = "SUCCESS";
constexpr auto REPLY_FAILURE = "FAILURE";
constexpr auto REPLY_REJECTED = "REJECTED";
constexpr auto REPLY_UNKNOWN_COMMAND = "UNKNOWN_COMMAND";
constexpr auto REPLY_SERVER_ERROR = "SERVER_ERROR";

constexpr auto ARCHIVE_ATTACHED = "1";
constexpr auto ARCHIVE_NONE = "0";

constexpr auto SOURCE_EXTENSION = ".tex";

inline std::vector<uint8_t> to_frame(const std::string& text) { return std::vector<uint8_t>(text.begin(), text.end()); }

inline std::string from_frame(const std::vector<uint8_t>& frame) { return std::string(frame.begin(), frame.end()); }

}  // namespace protocol
