#pragma once

#include "gemframe/protocol/status.hpp"

#include <boost/url/url.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace gemframe::protocol {

// Client request frame: optional blank lines, then an absolute URL line.
struct Request {
  std::optional<boost::urls::url> url;

  // Parses from the start of `buf`. On Complete, `url` is set and the value
  // is the number of bytes the frame occupied. On Partial or error the
  // request is left untouched. The request line has no length ceiling;
  // callers bound their receive buffer.
  [[nodiscard]] auto parse(std::span<const std::uint8_t> buf)
      -> ParseResult<std::size_t>;

  auto operator==(const Request &) const -> bool = default;
};

} // namespace gemframe::protocol
