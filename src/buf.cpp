#include "maybe_utf8/buf.hpp"

#include "maybe_utf8/lossy.hpp"

namespace maybe_utf8 {

ByteBuf Buf::into_bytes() && {
    if (auto* bytes = std::get_if<1>(&value_)) {
        return std::move(*bytes);
    }
    // std::string and std::vector cannot share storage; one copy.
    const ByteView encoded = as_byte_view(*std::get_if<0>(&value_));
    return ByteBuf(encoded.begin(), encoded.end());
}

TextResult Buf::try_into_text() && {
    if (auto* text = std::get_if<0>(&value_)) {
        return std::move(*text);
    }

    ByteBuf& bytes = *std::get_if<1>(&value_);
    const std::size_t valid = valid_up_to(bytes);
    if (valid != bytes.size()) {
        return InvalidEncoding{std::move(bytes), valid};
    }

    std::string text(as_char_view(bytes));
    bytes = ByteBuf{};
    return text;
}

bool Buf::try_promote() {
    if (const auto* bytes = std::get_if<1>(&value_)) {
        if (!is_valid_utf8(*bytes)) {
            return false;
        }
        value_ = Value(std::in_place_index<0>, as_char_view(*bytes));
    }
    return true;
}

std::string Buf::into_str_lossy() && {
    return std::move(*this).map_into_str([](ByteBuf bytes) {
        return decode_lossy(bytes);
    });
}

} // namespace maybe_utf8
