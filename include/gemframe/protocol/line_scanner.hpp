#pragma once

#include "gemframe/protocol/byte_cursor.hpp"
#include "gemframe/protocol/status.hpp"

#include <cstddef>
#include <cstdint>

namespace gemframe::protocol {

inline constexpr std::uint8_t kCR = '\r';
inline constexpr std::uint8_t kLF = '\n';

// Consumes blank lines (CRLF or bare LF). Completes with the cursor on the
// first byte of a content line; Partial if the buffer ends first.
[[nodiscard]] auto skip_empty_lines(ByteCursor &cursor) -> ParseResult<void>;

// Scans to the end of the current line and consumes its terminator.
// Completes with the offset one past the last content byte.
[[nodiscard]] auto next_line(ByteCursor &cursor) -> ParseResult<std::size_t>;

// As next_line, but fails with Error::NewLine once the content would exceed
// `limit` bytes, whether or not a terminator follows.
[[nodiscard]] auto next_line_limit(ByteCursor &cursor, std::size_t limit)
    -> ParseResult<std::size_t>;

} // namespace gemframe::protocol
