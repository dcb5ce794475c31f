#include "maybe_utf8/slice.hpp"

#include "maybe_utf8/buf.hpp"
#include "maybe_utf8/lossy.hpp"

#include <string>

namespace maybe_utf8 {

std::optional<std::string_view> Slice::as_text() const noexcept {
    if (const auto* text = if_text()) {
        return *text;
    }
    const ByteView bytes = *if_bytes();
    if (!is_valid_utf8(bytes)) {
        return std::nullopt;
    }
    return as_char_view(bytes);
}

Buf Slice::to_owned() const {
    if (const auto* text = if_text()) {
        return Buf::from_text(std::string(*text));
    }
    const ByteView bytes = *if_bytes();
    return Buf::from_bytes(ByteBuf(bytes.begin(), bytes.end()));
}

CowText Slice::as_cow_lossy() const {
    return map_as_cow([](ByteView bytes) -> CowText {
        // Bytes that are already UTF-8 are borrowed, not re-encoded.
        if (is_valid_utf8(bytes)) {
            return CowText(as_char_view(bytes));
        }
        return CowText(decode_lossy(bytes));
    });
}

} // namespace maybe_utf8
