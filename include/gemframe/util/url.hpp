#pragma once

#include "gemframe/core/error.hpp"
#include "gemframe/util/log.hpp"

#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>

#include <string_view>

namespace gemframe::util {

// Absolute URI with optional fragment; relative references are rejected.
[[nodiscard]] inline auto parse_absolute_url(std::string_view text)
    -> Result<boost::urls::url> {
  auto parsed = boost::urls::parse_uri(text);
  if (!parsed) {
    log::debug("URL parse error (boost.url): {}", parsed.error().message());
    return fail(Error::ParseUrl);
  }
  return ok(boost::urls::url(*parsed));
}

} // namespace gemframe::util
