#pragma once

#include <cstddef>

namespace gemframe {

namespace protocol {
// Longest response metadata accepted, excluding the terminator.
constexpr std::size_t kMetaMaxLength = 1024;
// Advisory bound for a caller's request buffer: a 1024-byte URL plus CRLF.
constexpr std::size_t kMaxRequestBytes = 1026;
} // namespace protocol

} // namespace gemframe
