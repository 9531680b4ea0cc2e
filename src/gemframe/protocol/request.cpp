#include "gemframe/protocol/request.hpp"

#include "gemframe/protocol/byte_cursor.hpp"
#include "gemframe/protocol/line_scanner.hpp"
#include "gemframe/util/encoding.hpp"
#include "gemframe/util/log.hpp"
#include "gemframe/util/url.hpp"

namespace gemframe::protocol {

auto Request::parse(std::span<const std::uint8_t> buf)
    -> ParseResult<std::size_t> {
  ByteCursor cursor(buf);

  auto blank = skip_empty_lines(cursor);
  if (!blank) {
    log::debug("request rejected at offset {}: {}", cursor.pos(),
               blank.error().message());
    return fail(blank.error());
  }
  if (blank->is_partial()) {
    return partial<std::size_t>();
  }

  const auto start = cursor.pos();
  auto line = next_line(cursor);
  if (!line) {
    log::debug("request rejected at offset {}: {}", cursor.pos(),
               line.error().message());
    return fail(line.error());
  }
  if (line->is_partial()) {
    return partial<std::size_t>();
  }

  auto text = util::decode_utf8(cursor.slice(start, line->value()));
  if (!text) {
    log::debug("request line is not valid UTF-8 ({} bytes)",
               line->value() - start);
    return fail(text.error());
  }

  auto parsed = util::parse_absolute_url(*text);
  if (!parsed) {
    return fail(parsed.error());
  }

  url = std::move(*parsed);
  return complete<std::size_t>(cursor.pos());
}

} // namespace gemframe::protocol
