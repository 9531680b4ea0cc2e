#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace gemframe::protocol {

// Position-tracking view over a borrowed receive buffer. The buffer must
// outlive the cursor; nothing is copied.
class ByteCursor {
public:
  explicit ByteCursor(std::span<const std::uint8_t> buf) noexcept
      : buf_(buf) {}

  [[nodiscard]] auto peek() const noexcept -> std::optional<std::uint8_t> {
    if (pos_ >= buf_.size()) {
      return std::nullopt;
    }
    return buf_[pos_];
  }

  // Callers bump only after peek() observed a byte. Clamped so that
  // pos() <= size() holds even if that contract is broken.
  auto bump() noexcept -> void { pos_ = std::min(pos_ + 1, buf_.size()); }

  [[nodiscard]] auto next() noexcept -> std::optional<std::uint8_t> {
    auto b = peek();
    if (b) {
      ++pos_;
    }
    return b;
  }

  // [start, end) of the underlying buffer; out-of-range bounds are clamped.
  [[nodiscard]] auto slice(std::size_t start, std::size_t end) const noexcept
      -> std::span<const std::uint8_t> {
    end = std::min(end, buf_.size());
    start = std::min(start, end);
    return buf_.subspan(start, end - start);
  }

  [[nodiscard]] auto pos() const noexcept -> std::size_t { return pos_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return buf_.size();
  }
  [[nodiscard]] auto remaining() const noexcept -> std::size_t {
    return buf_.size() - pos_;
  }

private:
  std::span<const std::uint8_t> buf_;
  std::size_t pos_{0};
};

[[nodiscard]] inline auto as_bytes(std::string_view sv) noexcept
    -> std::span<const std::uint8_t> {
  return {reinterpret_cast<const std::uint8_t *>(sv.data()), sv.size()};
}

[[nodiscard]] inline auto as_chars(std::span<const std::uint8_t> bytes) noexcept
    -> std::string_view {
  return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}

} // namespace gemframe::protocol
