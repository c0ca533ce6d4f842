#pragma once
// Frame: length-prefixed wire unit shared by host and gateway
//
// Layout: [4-byte big-endian payload length][payload bytes]
// The prefix counts payload bytes only. 0 < length <= 1 MiB on both the send
// and the receive path; anything else is a FramingError, never a tool error.
// No compression, no checksum.

#include <conduit/error.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace conduit::frame {

constexpr size_t HEADER_SIZE = 4;
constexpr uint32_t MAX_PAYLOAD_SIZE = 1024 * 1024;

// Prepend the big-endian length. Throws FramingError on an empty or oversized payload.
std::string encode(const std::string& payload);

// Validate a length prefix without touching the payload.
uint32_t decode_length(const std::array<unsigned char, HEADER_SIZE>& header);

// Decode the first frame of an in-memory buffer. Throws FramingError if the
// prefix is illegal or the buffer ends before the payload does.
std::string decode(const std::string& buffer, size_t* consumed = nullptr);

// Read one frame from a stream socket.
// timeout_ms < 0 waits forever; otherwise the whole frame must arrive in time.
// Returns nullopt when the peer closed cleanly between frames.
// Throws FramingError on a bad prefix or a close mid-frame,
// TransportError on timeout or socket error.
std::optional<std::string> read_frame(int fd, int timeout_ms);

// Encode and write one frame. Throws FramingError / TransportError.
void write_frame(int fd, const std::string& payload, int timeout_ms);

} // namespace conduit::frame
