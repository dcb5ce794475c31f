#pragma once

#include <algorithm>   // std::min
#include <compare>     // std::strong_ordering
#include <cstddef>     // std::byte, std::size_t
#include <cstdint>     // std::uint8_t
#include <cstring>     // std::memcmp
#include <functional>  // std::hash
#include <span>        // std::span
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace maybe_utf8 {

// Owned raw byte buffer (no encoding claim).
using ByteBuf = std::vector<std::byte>;

// Borrowed raw bytes. Caller keeps the underlying storage alive.
using ByteView = std::span<const std::byte>;

// Which representation a container currently holds.
// Text:  payload is known to be valid UTF-8.
// Bytes: payload is opaque; it may or may not be UTF-8.
enum class Kind : std::uint8_t {
    Text,
    Bytes,
};

constexpr std::string_view kind_to_string(Kind kind) noexcept {
    switch (kind) {
        case Kind::Text:  return "text";
        case Kind::Bytes: return "bytes";
    }
    return "unknown";
}

// Reinterpret text as its byte encoding. No copy.
inline ByteView as_byte_view(std::string_view text) noexcept {
    return ByteView(reinterpret_cast<const std::byte*>(text.data()), text.size());
}

// Reinterpret bytes as chars. No copy, no validation.
inline std::string_view as_char_view(ByteView bytes) noexcept {
    return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

// Byte-lexicographic (unsigned) comparison.
inline std::strong_ordering compare_bytes(ByteView a, ByteView b) noexcept {
    const std::size_t n = std::min(a.size(), b.size());
    if (n != 0) {
        const int c = std::memcmp(a.data(), b.data(), n);
        if (c < 0) return std::strong_ordering::less;
        if (c > 0) return std::strong_ordering::greater;
    }
    return a.size() <=> b.size();
}

inline bool equal_bytes(ByteView a, ByteView b) noexcept {
    return compare_bytes(a, b) == std::strong_ordering::equal;
}

// Hash over the byte representation only. Buf and Slice both use this so
// that equal values hash equally whatever their Kind.
inline std::size_t hash_bytes(ByteView bytes) noexcept {
    return std::hash<std::string_view>{}(as_char_view(bytes));
}

} // namespace maybe_utf8
