#include "maybe_utf8/buf.hpp"
#include "maybe_utf8/slice.hpp"

#include <array>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

// Borrowed container tests: zero-copy views, to_owned, map_as_cow.

namespace {

std::string decode_latin1(maybe_utf8::ByteView bytes) {
    std::string out;
    for (std::byte b : bytes) {
        const auto c = std::to_integer<unsigned char>(b);
        if (c < 0x80) {
            out += static_cast<char>(c);
        } else {
            out += static_cast<char>(0xC0 | (c >> 6));
            out += static_cast<char>(0x80 | (c & 0x3F));
        }
    }
    return out;
}

} // namespace

int main() {
    const std::array<std::byte, 4> cafe_latin1 = {
        std::byte{99}, std::byte{97}, std::byte{102}, std::byte{233}};

    // Test 1: Views point at the caller's storage
    {
        std::string owner = "archive/";
        auto text = maybe_utf8::Slice::from_text_ref(owner);
        if (!text.is_text() || text.as_bytes().data() != reinterpret_cast<const std::byte*>(owner.data())) {
            std::printf("from_text_ref test failed: not a view\n");
            return EXIT_FAILURE;
        }

        auto bytes = maybe_utf8::Slice::from_bytes_ref(cafe_latin1);
        if (!bytes.is_bytes() || bytes.as_bytes().data() != cafe_latin1.data() || bytes.size() != 4) {
            std::printf("from_bytes_ref test failed: not a view\n");
            return EXIT_FAILURE;
        }
    }

    // Test 2: Default Slice is empty Text
    {
        maybe_utf8::Slice s;
        if (!s.is_text() || !s.empty()) {
            std::printf("Default Slice test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 3: to_owned copies and keeps the Kind
    {
        auto owned = maybe_utf8::Slice::from_bytes_ref(cafe_latin1).to_owned();
        if (!owned.is_bytes() || owned.size() != 4 ||
            owned.as_bytes().data() == cafe_latin1.data()) {
            std::printf("to_owned (Bytes) test failed\n");
            return EXIT_FAILURE;
        }

        std::string_view name = "docs/readme.md";
        auto owned_text = maybe_utf8::Slice::from_text_ref(name).to_owned();
        if (!owned_text.is_text() || *owned_text.if_text() != name) {
            std::printf("to_owned (Text) test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 4: map_as_cow borrows Text, decodes Bytes
    {
        std::string_view name = "caf\xC3\xA9";
        int calls = 0;
        auto decode = [&calls](maybe_utf8::ByteView b) {
            ++calls;
            return decode_latin1(b);
        };

        auto borrowed = maybe_utf8::Slice::from_text_ref(name).map_as_cow(decode);
        if (!borrowed.is_borrowed() || borrowed.view().data() != name.data() || calls != 0) {
            std::printf("map_as_cow (Text) test failed\n");
            return EXIT_FAILURE;
        }

        auto decoded = maybe_utf8::Slice::from_bytes_ref(cafe_latin1).map_as_cow(decode);
        if (!decoded.is_owned() || decoded.view() != name || calls != 1) {
            std::printf("map_as_cow (Bytes) test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 5: A decoder may hand back a borrow of the input itself
    {
        std::string_view ascii = "ascii.txt";
        auto s = maybe_utf8::Slice::from_bytes_ref(maybe_utf8::as_byte_view(ascii));
        auto cow = s.map_as_cow([](maybe_utf8::ByteView b) { return maybe_utf8::as_char_view(b); });
        if (!cow.is_borrowed() || cow.view() != ascii) {
            std::printf("map_as_cow borrowed-result test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 6: as_cow_lossy borrows valid bytes, replaces invalid ones
    {
        std::string_view valid = "na\xC3\xAFve";
        auto borrowed = maybe_utf8::Slice::from_bytes_ref(maybe_utf8::as_byte_view(valid)).as_cow_lossy();
        if (!borrowed.is_borrowed() || borrowed.view() != valid) {
            std::printf("as_cow_lossy (valid) test failed\n");
            return EXIT_FAILURE;
        }

        auto replaced = maybe_utf8::Slice::from_bytes_ref(cafe_latin1).as_cow_lossy();
        if (!replaced.is_owned() || replaced.view() != "caf\xEF\xBF\xBD") {
            std::printf("as_cow_lossy (invalid) test failed\n");
            return EXIT_FAILURE;
        }
    }

    // Test 7: Borrowing from a Buf never changes it
    {
        auto buf = maybe_utf8::Buf::from_bytes(
            maybe_utf8::ByteBuf(cafe_latin1.begin(), cafe_latin1.end()));
        const std::byte* storage = buf.as_bytes().data();

        auto first = buf.to_slice();
        auto second = buf.to_slice();
        (void)first.as_text();
        (void)second.as_cow_lossy();
        (void)first.to_owned();

        if (!buf.is_bytes() || buf.size() != 4 || buf.as_bytes().data() != storage) {
            std::printf("Non-mutating borrow test failed\n");
            return EXIT_FAILURE;
        }
        if (first.as_bytes().data() != storage || second != first) {
            std::printf("Non-mutating borrow test failed: views differ\n");
            return EXIT_FAILURE;
        }
    }

    // Test 8: as_text on Bytes views the same storage when valid
    {
        std::string_view valid = "dir/file";
        auto s = maybe_utf8::Slice::from_bytes_ref(maybe_utf8::as_byte_view(valid));
        auto text = s.as_text();
        if (!text || text->data() != valid.data() || !s.is_bytes()) {
            std::printf("Slice as_text test failed\n");
            return EXIT_FAILURE;
        }
    }

    std::printf("All Slice tests passed\n");
    return EXIT_SUCCESS;
}
