#pragma once

#include "gemframe/core/constants.hpp"
#include "gemframe/protocol/status.hpp"
#include "gemframe/protocol/status_code.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace gemframe::protocol {

// Server response header: "<2 digits> <meta><CRLF|LF>".
struct Response {
  std::optional<std::uint16_t> status;
  std::optional<std::string> meta;

  [[nodiscard]] auto parse(std::span<const std::uint8_t> buf)
      -> ParseResult<void>;
  [[nodiscard]] auto parse(std::span<const std::uint8_t> buf,
                           std::size_t meta_max_length) -> ParseResult<void>;

  // Same grammar as parse(); completes with the header length so the caller
  // can find where the body starts in the same buffer.
  [[nodiscard]] auto parse_header(std::span<const std::uint8_t> buf,
                                  std::size_t meta_max_length = kMetaMaxLength)
      -> ParseResult<std::size_t>;

  [[nodiscard]] auto category() const noexcept -> StatusCategory {
    return status ? status_category(*status) : StatusCategory::Unknown;
  }

  auto operator==(const Response &) const -> bool = default;
};

} // namespace gemframe::protocol
