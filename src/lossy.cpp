#include "maybe_utf8/lossy.hpp"

#include <utf8.h>

namespace maybe_utf8 {

namespace {

// utfcpp masks each octet with integer arithmetic, which std::byte does
// not support, so it walks the same storage as chars.
const char* begin_of(ByteView bytes) noexcept {
    return reinterpret_cast<const char*>(bytes.data());
}

const char* end_of(ByteView bytes) noexcept {
    return begin_of(bytes) + bytes.size();
}

// Length of the maximal subpart of an ill-formed sequence starting at
// `bytes[0]`: the lead byte plus the continuation bytes that are still
// acceptable for that lead (Unicode 3.9, table 3-7). At least 1.
std::size_t invalid_sequence_length(ByteView bytes) noexcept {
    const auto lead = std::to_integer<unsigned char>(bytes[0]);

    std::size_t needed = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        needed = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        needed = 2;
        if (lead == 0xE0) lo = 0xA0;
        if (lead == 0xED) hi = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        needed = 3;
        if (lead == 0xF0) lo = 0x90;
        if (lead == 0xF4) hi = 0x8F;
    }

    std::size_t len = 1;
    while (len <= needed && len < bytes.size()) {
        const auto c = std::to_integer<unsigned char>(bytes[len]);
        if (c < lo || c > hi) {
            break;
        }
        ++len;
        lo = 0x80;
        hi = 0xBF;
    }
    return len;
}

} // namespace

bool is_valid_utf8(ByteView bytes) noexcept {
    return utf8::is_valid(begin_of(bytes), end_of(bytes));
}

std::size_t valid_up_to(ByteView bytes) noexcept {
    const char* first = begin_of(bytes);
    return static_cast<std::size_t>(utf8::find_invalid(first, end_of(bytes)) - first);
}

std::string decode_lossy(ByteView bytes) {
    std::string out;
    append_lossy(bytes, out);
    return out;
}

void append_lossy(ByteView bytes, std::string& out) {
    out.reserve(out.size() + bytes.size());
    ByteView rest = bytes;
    while (!rest.empty()) {
        const std::size_t valid = valid_up_to(rest);
        out.append(begin_of(rest), valid);
        if (valid == rest.size()) {
            return;
        }
        out.append(kReplacementChar);
        rest = rest.subspan(valid + invalid_sequence_length(rest.subspan(valid)));
    }
}

} // namespace maybe_utf8
