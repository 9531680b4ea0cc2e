#pragma once

#include "gemframe/core/error.hpp"

#include <boost/locale/encoding_errors.hpp>
#include <boost/locale/encoding_utf.hpp>

#include <cstdint>
#include <span>
#include <string>

namespace gemframe::util {

// Copies `bytes` into an owned string, rejecting malformed UTF-8 (overlong
// forms, surrogates and truncated sequences included).
[[nodiscard]] inline auto decode_utf8(std::span<const std::uint8_t> bytes)
    -> Result<std::string> {
  const auto *begin = reinterpret_cast<const char *>(bytes.data());
  try {
    return ok(boost::locale::conv::utf_to_utf<char>(
        begin, begin + bytes.size(), boost::locale::conv::stop));
  } catch (const boost::locale::conv::conversion_error &) {
    return fail(Error::InvalidUtf8);
  }
}

} // namespace gemframe::util
