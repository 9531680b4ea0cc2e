#include "gemframe/config/config.hpp"
#include "toml_util.hpp"

#include "gemframe/core/error.hpp"
#include "gemframe/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include <string>
#include <string_view>
#include <type_traits>

namespace gemframe {
namespace detail {

struct ParserToml {
  std::size_t meta_max_length{protocol::kMetaMaxLength};
  std::size_t max_request_bytes{protocol::kMaxRequestBytes};
};

struct LoggingToml {
  std::string level{"info"};
  std::string file;
};

struct ConfigToml {
  ParserToml parser{};
  LoggingToml logging{};
};

} // namespace detail
} // namespace gemframe

namespace glz {
template <> struct meta<gemframe::detail::ParserToml> {
  using T = gemframe::detail::ParserToml;
  static constexpr auto value =
      object("meta_max_length", &T::meta_max_length, "max_request_bytes",
             &T::max_request_bytes);
};

template <> struct meta<gemframe::detail::LoggingToml> {
  using T = gemframe::detail::LoggingToml;
  static constexpr auto value = object("level", &T::level, "file", &T::file);
};

template <> struct meta<gemframe::detail::ConfigToml> {
  using T = gemframe::detail::ConfigToml;
  static constexpr auto value =
      object("parser", &T::parser, "logging", &T::logging);
};
} // namespace glz

namespace gemframe {
namespace {

// Overrides `out` from the environment; false if the value does not parse.
// lexical_cast wraps a negative number into an unsigned target, so a sign is
// rejected up front.
template <typename T>
[[nodiscard]] auto env_override(const char *name, T &out) -> bool {
  const char *v = std::getenv(name);
  if (v == nullptr) {
    return true;
  }
  if constexpr (std::is_unsigned_v<T>) {
    std::string_view text(v);
    const auto first = text.find_first_not_of(" \t");
    if (first != std::string_view::npos && text[first] == '-') {
      log::error("Invalid value for {}: '{}'", name, v);
      return false;
    }
  }
  try {
    out = boost::lexical_cast<T>(v);
  } catch (const boost::bad_lexical_cast &) {
    log::error("Invalid value for {}: '{}'", name, v);
    return false;
  }
  return true;
}

[[nodiscard]] auto convert_toml(std::string_view toml_text) -> Result<Config> {
  auto raw_result = toml_util::parse_toml<detail::ConfigToml>(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = *raw_result;

  Config cfg{};
  cfg.parser.meta_max_length = raw.parser.meta_max_length;
  cfg.parser.max_request_bytes = raw.parser.max_request_bytes;
  cfg.logging.level = std::move(raw.logging.level);
  cfg.logging.file = std::move(raw.logging.file);

  if (!env_override("GEMFRAME_META_MAX_LENGTH", cfg.parser.meta_max_length) ||
      !env_override("GEMFRAME_MAX_REQUEST_BYTES",
                    cfg.parser.max_request_bytes)) {
    return fail(Error::ParseError);
  }
  if (const char *v = std::getenv("GEMFRAME_LOG_LEVEL"); v != nullptr) {
    cfg.logging.level = v;
  }
  if (const char *v = std::getenv("GEMFRAME_LOG_FILE"); v != nullptr) {
    cfg.logging.file = v;
  }

  if (cfg.parser.meta_max_length == 0 || cfg.parser.max_request_bytes == 0) {
    log::error("parser limits must be positive");
    return fail(Error::ParseError);
  }
  if (!log::parse_level(cfg.logging.level)) {
    log::error("Unknown log level '{}'", cfg.logging.level);
    return fail(Error::ParseError);
  }
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path) -> Result<Config> {
  auto text = toml_util::read_file(path);
  if (!text) {
    log::error("Failed to read config file: {}", path);
    return fail(text.error());
  }
  return convert_toml(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<Config> {
  return convert_toml(toml_str);
}

auto apply_logging(const LoggingConfig &cfg) -> Result<void> {
  if (!log::set_level(cfg.level)) {
    return fail(Error::InvalidArgument);
  }
  if (!log::set_output_file(cfg.file)) {
    log::error("Failed to open log file: {}", cfg.file);
    return fail(Error::FileNotFound);
  }
  return ok();
}

} // namespace gemframe
