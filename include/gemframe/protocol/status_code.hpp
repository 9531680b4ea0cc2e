#pragma once

#include "gemframe/protocol/byte_cursor.hpp"
#include "gemframe/protocol/status.hpp"
#include "gemframe/util/enum.hpp"

#include <boost/describe/enum.hpp>

#include <cstdint>
#include <string_view>

namespace gemframe {

// First digit of a response status code.
enum class StatusCategory : std::uint8_t {
  Unknown,
  Input,
  Success,
  Redirect,
  TemporaryFailure,
  PermanentFailure,
  ClientCertificate,
};
BOOST_DESCRIBE_ENUM(StatusCategory, Unknown, Input, Success, Redirect,
                    TemporaryFailure, PermanentFailure, ClientCertificate)
GEMFRAME_DEFINE_ENUM_SERDE(StatusCategory, StatusCategory::Unknown)

[[nodiscard]] constexpr auto status_category(std::uint16_t code) noexcept
    -> StatusCategory {
  switch (code / 10) {
  case 1:
    return StatusCategory::Input;
  case 2:
    return StatusCategory::Success;
  case 3:
    return StatusCategory::Redirect;
  case 4:
    return StatusCategory::TemporaryFailure;
  case 5:
    return StatusCategory::PermanentFailure;
  case 6:
    return StatusCategory::ClientCertificate;
  default:
    return StatusCategory::Unknown;
  }
}

namespace protocol {

// Reads exactly two ASCII digits. Completes with a value in [0, 99].
[[nodiscard]] auto parse_status(ByteCursor &cursor)
    -> ParseResult<std::uint16_t>;

} // namespace protocol

} // namespace gemframe
