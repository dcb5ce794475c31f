#pragma once

#include "maybe_utf8/buf.hpp"
#include "maybe_utf8/slice.hpp"
#include "maybe_utf8/types.hpp"

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace maybe_utf8 {

// ============================================================================
// IntoMaybeUtf8: "anything string-like" -> Buf.
//
// One specialisation per source type, each with a single static
// convert(). Text-typed sources become Text, byte-typed sources become
// Bytes. Conversion never fails and never inspects the contents.
//
// Lets an API take either kind of input through one template:
//
//   template <IntoMaybeUtf8Source Name>
//   void add_entry(Name&& name) {
//       Buf owned = into_maybe_utf8(std::forward<Name>(name));
//       ...
//   }
// ============================================================================

template <typename T>
struct IntoMaybeUtf8;

template <>
struct IntoMaybeUtf8<std::string> {
    static Buf convert(std::string text) noexcept { return Buf::from_text(std::move(text)); }
};

template <>
struct IntoMaybeUtf8<std::string_view> {
    static Buf convert(std::string_view text) { return Buf::from_text(std::string(text)); }
};

// String literals and other NUL-terminated UTF-8.
template <>
struct IntoMaybeUtf8<const char*> {
    static Buf convert(const char* text) { return Buf::from_text(std::string(text)); }
};

template <>
struct IntoMaybeUtf8<ByteBuf> {
    static Buf convert(ByteBuf bytes) noexcept { return Buf::from_bytes(std::move(bytes)); }
};

template <>
struct IntoMaybeUtf8<ByteView> {
    static Buf convert(ByteView bytes) { return Buf::from_bytes(ByteBuf(bytes.begin(), bytes.end())); }
};

// Already "maybe UTF-8": keeps its Kind.
template <>
struct IntoMaybeUtf8<Slice> {
    static Buf convert(const Slice& slice) { return slice.to_owned(); }
};

template <>
struct IntoMaybeUtf8<Buf> {
    static Buf convert(Buf buf) noexcept { return buf; }
};

template <typename T>
concept IntoMaybeUtf8Source = requires(T&& src) {
    { IntoMaybeUtf8<std::decay_t<T>>::convert(std::forward<T>(src)) } -> std::same_as<Buf>;
};

template <IntoMaybeUtf8Source T>
[[nodiscard]] Buf into_maybe_utf8(T&& src) {
    return IntoMaybeUtf8<std::decay_t<T>>::convert(std::forward<T>(src));
}

} // namespace maybe_utf8
