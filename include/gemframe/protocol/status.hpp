#pragma once

#include "gemframe/core/error.hpp"

#include <optional>
#include <utility>

namespace gemframe::protocol {

// Outcome of a parse step that ran out of input or matched the grammar.
// Partial is not an error: the caller appends bytes and parses again.
template <typename T> class Status {
public:
  [[nodiscard]] static auto complete(T value) -> Status {
    return Status{std::move(value)};
  }
  [[nodiscard]] static auto partial() -> Status { return Status{}; }

  [[nodiscard]] auto is_complete() const noexcept -> bool {
    return value_.has_value();
  }
  [[nodiscard]] auto is_partial() const noexcept -> bool {
    return !value_.has_value();
  }

  [[nodiscard]] auto value() const & -> const T & { return value_.value(); }
  [[nodiscard]] auto value() && -> T { return std::move(value_).value(); }

  auto operator==(const Status &) const -> bool = default;

private:
  Status() = default;
  explicit Status(T value) : value_(std::move(value)) {}

  std::optional<T> value_;
};

template <> class Status<void> {
public:
  [[nodiscard]] static auto complete() -> Status { return Status{true}; }
  [[nodiscard]] static auto partial() -> Status { return Status{false}; }

  [[nodiscard]] auto is_complete() const noexcept -> bool { return complete_; }
  [[nodiscard]] auto is_partial() const noexcept -> bool { return !complete_; }

  auto operator==(const Status &) const -> bool = default;

private:
  explicit Status(bool complete) : complete_(complete) {}

  bool complete_{false};
};

template <typename T> using ParseResult = Result<Status<T>>;

template <typename T>
[[nodiscard]] auto complete(T value) -> ParseResult<T> {
  return Status<T>::complete(std::move(value));
}

[[nodiscard]] inline auto complete() -> ParseResult<void> {
  return Status<void>::complete();
}

template <typename T> [[nodiscard]] auto partial() -> ParseResult<T> {
  return Status<T>::partial();
}

} // namespace gemframe::protocol
