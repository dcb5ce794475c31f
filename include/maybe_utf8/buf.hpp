#pragma once

#include "maybe_utf8/cow_text.hpp"
#include "maybe_utf8/slice.hpp"
#include "maybe_utf8/types.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace maybe_utf8 {

// ============================================================================
// Buf: owned bytes that may or may not be UTF-8.
//
// Either Text (a std::string known to be valid UTF-8) or Bytes (an opaque
// byte vector, e.g. a file name read from a legacy archive).
//
// Invariants:
// 1. A Text payload is valid UTF-8 at all times. Nothing in this class
//    writes into a Text payload; it is only replaced wholesale.
// 2. A Bytes payload carries no claim. It is never rewritten or dropped:
//    every conversion either succeeds or hands the bytes back.
// 3. The Kind is the only record of "known to be text". Equality, ordering
//    and hashing ignore it.
// ============================================================================

// try_into_text failure: the bytes were not UTF-8.
struct InvalidEncoding {
    ByteBuf bytes;            // the original bytes, unchanged
    std::size_t valid_up_to;  // length of the longest valid UTF-8 prefix
};

// Result type: the text, or the bytes handed back.
using TextResult = std::variant<std::string, InvalidEncoding>;

class Buf {
public:
    // Empty Text.
    Buf() = default;

    // Caller guarantees `text` is valid UTF-8.
    static Buf from_text(std::string text) noexcept {
        return Buf(Value(std::in_place_index<0>, std::move(text)));
    }

    // No validation, O(1).
    static Buf from_bytes(ByteBuf bytes) noexcept {
        return Buf(Value(std::in_place_index<1>, std::move(bytes)));
    }

    [[nodiscard]] Kind kind() const noexcept {
        return value_.index() == 0 ? Kind::Text : Kind::Bytes;
    }

    [[nodiscard]] bool is_text() const noexcept { return kind() == Kind::Text; }
    [[nodiscard]] bool is_bytes() const noexcept { return kind() == Kind::Bytes; }

    [[nodiscard]] std::size_t size() const noexcept { return as_bytes().size(); }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    // Underlying bytes. For Text this is the UTF-8 encoding.
    [[nodiscard]] ByteView as_bytes() const noexcept {
        if (const auto* text = std::get_if<0>(&value_)) {
            return as_byte_view(*text);
        }
        return ByteView(*std::get_if<1>(&value_));
    }

    [[nodiscard]] const std::string* if_text() const noexcept {
        return std::get_if<0>(&value_);
    }

    [[nodiscard]] const ByteBuf* if_bytes() const noexcept {
        return std::get_if<1>(&value_);
    }

    // See Slice::as_text.
    [[nodiscard]] std::optional<std::string_view> as_text() const noexcept {
        return to_slice().as_text();
    }

    // Raw bytes, whatever the Kind. Never fails.
    [[nodiscard]] ByteBuf into_bytes() &&;

    // Text is returned as is. Bytes are validated over their whole length:
    // on success they become the returned string, on failure they come back
    // untouched inside InvalidEncoding.
    [[nodiscard]] TextResult try_into_text() &&;

    // In-place promotion of valid UTF-8 Bytes to Text. Returns is_text().
    // On failure the value is left exactly as it was.
    bool try_promote();

    // Zero-copy view. The Slice must not outlive this Buf, and the Buf must
    // not be modified while the Slice is in use.
    [[nodiscard]] Slice to_slice() const& noexcept {
        if (const auto* text = std::get_if<0>(&value_)) {
            return Slice::from_text_ref(*text);
        }
        return Slice::from_bytes_ref(*std::get_if<1>(&value_));
    }
    Slice to_slice() const&& = delete;

    // Text is returned as is; Bytes are handed to `decode(ByteBuf)`, which
    // is where a caller plugs in knowledge of the real encoding.
    template <typename F>
    [[nodiscard]] std::string map_into_str(F&& decode) && {
        if (auto* text = std::get_if<0>(&value_)) {
            return std::move(*text);
        }
        return std::invoke(std::forward<F>(decode), std::move(*std::get_if<1>(&value_)));
    }

    // map_into_str with U+FFFD substitution.
    [[nodiscard]] std::string into_str_lossy() &&;

    // See Slice::map_as_cow.
    template <typename F>
    [[nodiscard]] CowText map_as_cow(F&& decode) const& {
        return to_slice().map_as_cow(std::forward<F>(decode));
    }
    template <typename F>
    CowText map_as_cow(F&& decode) const&& = delete;

    [[nodiscard]] CowText as_cow_lossy() const& { return to_slice().as_cow_lossy(); }
    CowText as_cow_lossy() const&& = delete;

private:
    using Value = std::variant<std::string, ByteBuf>;

    explicit Buf(Value value) noexcept : value_(std::move(value)) {}

    Value value_;
};

inline bool operator==(const Buf& a, const Buf& b) noexcept {
    return equal_bytes(a.as_bytes(), b.as_bytes());
}

inline std::strong_ordering operator<=>(const Buf& a, const Buf& b) noexcept {
    return compare_bytes(a.as_bytes(), b.as_bytes());
}

inline bool operator==(const Buf& a, const Slice& b) noexcept {
    return equal_bytes(a.as_bytes(), b.as_bytes());
}

inline std::strong_ordering operator<=>(const Buf& a, const Slice& b) noexcept {
    return compare_bytes(a.as_bytes(), b.as_bytes());
}

inline bool operator==(const Buf& a, std::string_view b) noexcept {
    return equal_bytes(a.as_bytes(), as_byte_view(b));
}

inline std::strong_ordering operator<=>(const Buf& a, std::string_view b) noexcept {
    return compare_bytes(a.as_bytes(), as_byte_view(b));
}

inline bool operator==(const Buf& a, ByteView b) noexcept {
    return equal_bytes(a.as_bytes(), b);
}

inline std::strong_ordering operator<=>(const Buf& a, ByteView b) noexcept {
    return compare_bytes(a.as_bytes(), b);
}

} // namespace maybe_utf8

template <>
struct std::hash<maybe_utf8::Buf> {
    std::size_t operator()(const maybe_utf8::Buf& b) const noexcept {
        return maybe_utf8::hash_bytes(b.as_bytes());
    }
};
