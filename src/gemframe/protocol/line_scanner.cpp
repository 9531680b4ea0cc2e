#include "gemframe/protocol/line_scanner.hpp"

#include <optional>

namespace gemframe::protocol {

namespace {

auto scan_line(ByteCursor &cursor, std::optional<std::size_t> limit)
    -> ParseResult<std::size_t> {
  const auto start = cursor.pos();
  for (;;) {
    const auto b = cursor.peek();
    if (!b) {
      return partial<std::size_t>();
    }

    if (*b == kCR) {
      cursor.bump();
      const auto lf = cursor.next();
      if (!lf) {
        return partial<std::size_t>();
      }
      if (*lf != kLF) {
        return fail(Error::NewLine);
      }
      return complete<std::size_t>(cursor.pos() - 2);
    }

    if (*b == kLF) {
      cursor.bump();
      return complete<std::size_t>(cursor.pos() - 1);
    }

    if (limit && cursor.pos() - start + 1 > *limit) {
      return fail(Error::NewLine);
    }
    cursor.bump();
  }
}

} // namespace

auto skip_empty_lines(ByteCursor &cursor) -> ParseResult<void> {
  for (;;) {
    const auto b = cursor.peek();
    if (!b) {
      return partial<void>();
    }

    if (*b == kCR) {
      cursor.bump();
      const auto lf = cursor.next();
      if (!lf) {
        return partial<void>();
      }
      if (*lf != kLF) {
        return fail(Error::NewLine);
      }
      continue;
    }

    if (*b == kLF) {
      cursor.bump();
      continue;
    }

    return complete();
  }
}

auto next_line(ByteCursor &cursor) -> ParseResult<std::size_t> {
  return scan_line(cursor, std::nullopt);
}

auto next_line_limit(ByteCursor &cursor, std::size_t limit)
    -> ParseResult<std::size_t> {
  return scan_line(cursor, limit);
}

} // namespace gemframe::protocol
