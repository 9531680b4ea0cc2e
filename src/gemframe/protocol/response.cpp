#include "gemframe/protocol/response.hpp"

#include "gemframe/protocol/byte_cursor.hpp"
#include "gemframe/protocol/line_scanner.hpp"
#include "gemframe/util/encoding.hpp"
#include "gemframe/util/log.hpp"

namespace gemframe::protocol {

namespace {

constexpr std::uint8_t kSeparator = ' ';

auto reject(const ByteCursor &cursor, std::error_code ec)
    -> std::unexpected<std::error_code> {
  log::debug("response header rejected at offset {}: {}", cursor.pos(),
             ec.message());
  return fail(ec);
}

} // namespace

auto Response::parse(std::span<const std::uint8_t> buf) -> ParseResult<void> {
  return parse(buf, kMetaMaxLength);
}

auto Response::parse(std::span<const std::uint8_t> buf,
                     std::size_t meta_max_length) -> ParseResult<void> {
  auto header = parse_header(buf, meta_max_length);
  if (!header) {
    return fail(header.error());
  }
  if (header->is_partial()) {
    return partial<void>();
  }
  return complete();
}

auto Response::parse_header(std::span<const std::uint8_t> buf,
                            std::size_t meta_max_length)
    -> ParseResult<std::size_t> {
  ByteCursor cursor(buf);

  auto code = parse_status(cursor);
  if (!code) {
    return reject(cursor, code.error());
  }
  if (code->is_partial()) {
    return partial<std::size_t>();
  }

  const auto sep = cursor.next();
  if (!sep) {
    return partial<std::size_t>();
  }
  if (*sep != kSeparator) {
    return reject(cursor, make_error_code(Error::ResponseHeader));
  }

  const auto start = cursor.pos();
  auto line = next_line_limit(cursor, meta_max_length);
  if (!line) {
    return reject(cursor, line.error());
  }
  if (line->is_partial()) {
    return partial<std::size_t>();
  }

  auto text = util::decode_utf8(cursor.slice(start, line->value()));
  if (!text) {
    return reject(cursor, text.error());
  }

  status = code->value();
  meta = std::move(*text);
  return complete<std::size_t>(cursor.pos());
}

} // namespace gemframe::protocol
