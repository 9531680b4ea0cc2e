#pragma once

#include "gemframe/core/constants.hpp"
#include "gemframe/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace gemframe {

struct ParserConfig {
  std::size_t meta_max_length{protocol::kMetaMaxLength};
  // Not enforced by the parsers; the request line has no ceiling of its own,
  // so the caller caps its receive buffer with this value.
  std::size_t max_request_bytes{protocol::kMaxRequestBytes};

  auto operator==(const ParserConfig &) const -> bool = default;
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file;

  auto operator==(const LoggingConfig &) const -> bool = default;
};

struct Config {
  ParserConfig parser;
  LoggingConfig logging;

  auto operator==(const Config &) const -> bool = default;
};

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<Config>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<Config>;
};

// Applies level and output file to the process logger.
[[nodiscard]] auto apply_logging(const LoggingConfig &cfg) -> Result<void>;

} // namespace gemframe
