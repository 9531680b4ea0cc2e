#include "gemframe/protocol/status_code.hpp"

#include <optional>

namespace gemframe::protocol {

namespace {

[[nodiscard]] constexpr auto is_digit(std::uint8_t b) noexcept -> bool {
  return b >= '0' && b <= '9';
}

} // namespace

auto parse_status(ByteCursor &cursor) -> ParseResult<std::uint16_t> {
  const auto tens = cursor.next();
  if (!tens) {
    return partial<std::uint16_t>();
  }
  if (!is_digit(*tens)) {
    return fail(Error::Status);
  }

  const auto ones = cursor.next();
  if (!ones) {
    return partial<std::uint16_t>();
  }
  if (!is_digit(*ones)) {
    return fail(Error::Status);
  }

  const auto code =
      static_cast<std::uint16_t>((*tens - '0') * 10 + (*ones - '0'));
  return complete<std::uint16_t>(code);
}

} // namespace gemframe::protocol
