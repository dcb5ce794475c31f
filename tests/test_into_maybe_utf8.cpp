#include "maybe_utf8/into.hpp"

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Conversion capability tests: every source kind becomes the right Kind.

namespace {

// One function for both kinds of input, the way a caller would use it.
template <maybe_utf8::IntoMaybeUtf8Source Name>
maybe_utf8::Buf make_entry_name(Name&& name) {
    return maybe_utf8::into_maybe_utf8(std::forward<Name>(name));
}

static_assert(maybe_utf8::IntoMaybeUtf8Source<std::string>);
static_assert(maybe_utf8::IntoMaybeUtf8Source<const std::string&>);
static_assert(maybe_utf8::IntoMaybeUtf8Source<std::string_view>);
static_assert(maybe_utf8::IntoMaybeUtf8Source<const char*>);
static_assert(maybe_utf8::IntoMaybeUtf8Source<maybe_utf8::ByteBuf>);
static_assert(maybe_utf8::IntoMaybeUtf8Source<maybe_utf8::ByteView>);
static_assert(maybe_utf8::IntoMaybeUtf8Source<maybe_utf8::Slice>);
static_assert(!maybe_utf8::IntoMaybeUtf8Source<int>);
static_assert(!maybe_utf8::IntoMaybeUtf8Source<std::vector<int>>);

} // namespace

int main() {
    // Test 1: Owned text -> Text, moved not copied
    {
        std::string s(64, 'x');
        const char* storage = s.data();
        auto b = make_entry_name(std::move(s));
        if (!b.is_text() || b.if_text()->data() != storage) {
            std::printf("Owned text conversion test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 2: Borrowed text and literals -> Text
    {
        std::string_view sv = "dir/a.txt";
        auto from_view = make_entry_name(sv);
        auto from_literal = make_entry_name("dir/a.txt");
        const std::string lvalue = "dir/a.txt";
        auto from_lvalue = make_entry_name(lvalue);
        if (!from_view.is_text() || !from_literal.is_text() || !from_lvalue.is_text()) {
            std::printf("Borrowed text conversion test failed: wrong Kind\n");
            return EXIT_FAILURE;
        }
        if (from_view != sv || from_literal != sv || from_lvalue != sv || lvalue != "dir/a.txt") {
            std::printf("Borrowed text conversion test failed: wrong content\n");
            return EXIT_FAILURE;
        }
    }

    // Test 3: Owned bytes -> Bytes, moved not copied; valid UTF-8 is not promoted
    {
        maybe_utf8::ByteBuf raw = {std::byte{'o'}, std::byte{'k'}};
        const std::byte* storage = raw.data();
        auto b = make_entry_name(std::move(raw));
        if (!b.is_bytes() || b.as_bytes().data() != storage) {
            std::printf("Owned bytes conversion test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 4: Borrowed bytes -> Bytes (copied)
    {
        const maybe_utf8::ByteBuf raw = {std::byte{0x93}, std::byte{0xFA}};
        auto b = make_entry_name(maybe_utf8::ByteView(raw));
        if (!b.is_bytes() || b.as_bytes().data() == raw.data() || b != maybe_utf8::ByteView(raw)) {
            std::printf("Borrowed bytes conversion test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 5: Slice and Buf keep their Kind
    {
        const maybe_utf8::ByteBuf raw = {std::byte{0xE9}};
        auto from_slice = make_entry_name(maybe_utf8::Slice::from_bytes_ref(raw));
        auto from_buf = make_entry_name(maybe_utf8::Buf::from_text("t"));
        if (!from_slice.is_bytes() || !from_buf.is_text()) {
            std::printf("Slice/Buf conversion test failed\n");
            return EXIT_FAILURE;
        }
    }

    std::printf("All conversion tests passed\n");
    return EXIT_SUCCESS;
}
