#pragma once

#include "maybe_utf8/cow_text.hpp"
#include "maybe_utf8/types.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>

namespace maybe_utf8 {

class Buf;

// ============================================================================
// Slice: borrowed bytes that may or may not be UTF-8.
//
// Either Text (a std::string_view known to be valid UTF-8) or Bytes (a
// std::span over opaque bytes). Never copies.
//
// Lifetime: a Slice views storage it does not own. The caller must keep
// that storage (a Buf, std::string, byte vector, ...) alive and unmodified
// for as long as the Slice is used. This is not checked at runtime.
// ============================================================================

class Slice {
public:
    // Empty Text.
    Slice() noexcept : value_(std::string_view{}) {}

    // Caller guarantees `text` is valid UTF-8.
    static Slice from_text_ref(std::string_view text) noexcept {
        return Slice(Value(std::in_place_index<0>, text));
    }

    // No validation, no scan.
    static Slice from_bytes_ref(ByteView bytes) noexcept {
        return Slice(Value(std::in_place_index<1>, bytes));
    }

    [[nodiscard]] Kind kind() const noexcept {
        return value_.index() == 0 ? Kind::Text : Kind::Bytes;
    }

    [[nodiscard]] bool is_text() const noexcept { return kind() == Kind::Text; }
    [[nodiscard]] bool is_bytes() const noexcept { return kind() == Kind::Bytes; }

    // Byte length, whatever the Kind.
    [[nodiscard]] std::size_t size() const noexcept { return as_bytes().size(); }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    // Underlying bytes. For Text this is the UTF-8 encoding.
    [[nodiscard]] ByteView as_bytes() const noexcept {
        if (const auto* text = std::get_if<0>(&value_)) {
            return as_byte_view(*text);
        }
        return *std::get_if<1>(&value_);
    }

    // The Text payload, or nullptr for Bytes. Does not validate.
    [[nodiscard]] const std::string_view* if_text() const noexcept {
        return std::get_if<0>(&value_);
    }

    // The Bytes payload, or nullptr for Text.
    [[nodiscard]] const ByteView* if_bytes() const noexcept {
        return std::get_if<1>(&value_);
    }

    // Text view if the contents are UTF-8: always for Text, after a
    // validation scan for Bytes. Never changes the Kind.
    [[nodiscard]] std::optional<std::string_view> as_text() const noexcept;

    // Copy into an owned Buf of the same Kind.
    [[nodiscard]] Buf to_owned() const;

    // Text: borrowed CowText over the same storage, no copy.
    // Bytes: whatever `decode(ByteView)` returns. It may return an owned
    // std::string, a CowText, or a view borrowing the same bytes.
    template <typename F>
    [[nodiscard]] CowText map_as_cow(F&& decode) const {
        if (const auto* text = std::get_if<0>(&value_)) {
            return CowText(*text);
        }
        return CowText(std::invoke(std::forward<F>(decode), *std::get_if<1>(&value_)));
    }

    // Borrowed when the contents are already UTF-8, lossy-decoded
    // (U+FFFD substitution) otherwise.
    [[nodiscard]] CowText as_cow_lossy() const;

private:
    using Value = std::variant<std::string_view, ByteView>;

    explicit Slice(Value value) noexcept : value_(value) {}

    Value value_;
};

// Comparison is over bytes only; Kind is provenance, not identity.
inline bool operator==(const Slice& a, const Slice& b) noexcept {
    return equal_bytes(a.as_bytes(), b.as_bytes());
}

inline std::strong_ordering operator<=>(const Slice& a, const Slice& b) noexcept {
    return compare_bytes(a.as_bytes(), b.as_bytes());
}

inline bool operator==(const Slice& a, std::string_view b) noexcept {
    return equal_bytes(a.as_bytes(), as_byte_view(b));
}

inline std::strong_ordering operator<=>(const Slice& a, std::string_view b) noexcept {
    return compare_bytes(a.as_bytes(), as_byte_view(b));
}

inline bool operator==(const Slice& a, ByteView b) noexcept {
    return equal_bytes(a.as_bytes(), b);
}

inline std::strong_ordering operator<=>(const Slice& a, ByteView b) noexcept {
    return compare_bytes(a.as_bytes(), b);
}

} // namespace maybe_utf8

template <>
struct std::hash<maybe_utf8::Slice> {
    std::size_t operator()(const maybe_utf8::Slice& s) const noexcept {
        return maybe_utf8::hash_bytes(s.as_bytes());
    }
};
