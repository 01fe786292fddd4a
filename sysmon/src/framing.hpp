#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

namespace sysmon::framing {

constexpr std::size_t kMaxBodySize = 64 * 1024 * 1024;

enum class ReadStatus {
    Message,      // body holds exactly Content-Length bytes
    EndOfStream,  // input ended where a header line was expected
    Truncated,    // input ended before the announced body length
    StreamError,  // the underlying stream failed
    Oversized,    // Content-Length above kMaxBodySize; nothing was read past the headers
};

/**
 * Read one header-framed message.
 *
 * Header lines end in "\r\n" (a bare "\n" is tolerated) and the block ends at
 * the first empty line. Header names are matched case-insensitively. A block
 * without a usable Content-Length is discarded and reading restarts with the
 * next block. A length above kMaxBodySize fails the frame with Oversized.
 * Blocks until the full body has arrived.
 */
ReadStatus read_frame(std::istream& in, std::string& body);

/// Write `Content-Length: <n>\r\n\r\n<body>` and flush.
bool write_frame(std::ostream& out, const std::string& body);

} // namespace sysmon::framing
