#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace gemframe {

enum class Error : std::uint8_t {
  Success,
  FileNotFound,
  ParseError,
  InvalidArgument,
  NewLine,
  InvalidUtf8,
  ParseUrl,
  ResponseHeader,
  Status,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 10> messages = {
      "success",
      "file not found",
      "parse error",
      "invalid argument",
      "invalid line terminator",
      "invalid UTF-8",
      "invalid URL",
      "invalid response header",
      "invalid status code",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "gemframe";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return std::string{messages.back()};
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

// Frame-level errors are terminal: the connection carrying them is malformed.
[[nodiscard]] inline auto is_protocol_error(std::error_code ec) -> bool {
  if (ec.category() != error_category()) {
    return false;
  }
  switch (static_cast<Error>(ec.value())) {
  case Error::NewLine:
  case Error::InvalidUtf8:
  case Error::ParseUrl:
  case Error::ResponseHeader:
  case Error::Status:
    return true;
  default:
    return false;
  }
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

} // namespace gemframe

template <> struct std::is_error_code_enum<gemframe::Error> : std::true_type {};
