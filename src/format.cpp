#include "maybe_utf8/format.hpp"

#include "maybe_utf8/lossy.hpp"

#include <cstddef>
#include <ostream>

namespace maybe_utf8 {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

void append_hex_escape(unsigned char c, std::string& out) {
    out += "\\x";
    out += kHexDigits[c >> 4];
    out += kHexDigits[c & 0x0F];
}

// Escapes shared by both forms. Returns false if `c` needs a form-specific
// escape.
bool append_common_escape(unsigned char c, std::string& out) {
    switch (c) {
        case '\t': out += "\\t";  return true;
        case '\r': out += "\\r";  return true;
        case '\n': out += "\\n";  return true;
        case '\\': out += "\\\\"; return true;
        case '"':  out += "\\\""; return true;
        default:   return false;
    }
}

// "..." with control characters escaped; non-ASCII text passes through.
std::string debug_text(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (append_common_escape(c, out)) {
            continue;
        }
        if (c < 0x20 || c == 0x7F) {
            out += "\\u{";
            if (c >= 0x10) {
                out += kHexDigits[c >> 4];
            }
            out += kHexDigits[c & 0x0F];
            out += '}';
        } else {
            out += ch;
        }
    }
    out += '"';
    return out;
}

// b"..." with everything outside printable ASCII as \xNN.
std::string debug_bytes(ByteView bytes) {
    std::string out;
    out.reserve(bytes.size() + 3);
    out += "b\"";
    for (std::byte b : bytes) {
        const auto c = std::to_integer<unsigned char>(b);
        if (append_common_escape(c, out)) {
            continue;
        }
        if (c == '\'') {
            out += "\\'";
        } else if (c >= 0x20 && c <= 0x7E) {
            out += static_cast<char>(c);
        } else {
            append_hex_escape(c, out);
        }
    }
    out += '"';
    return out;
}

} // namespace

std::string to_display_string(const Slice& value) {
    if (const auto* text = value.if_text()) {
        return std::string(*text);
    }
    return decode_lossy(*value.if_bytes());
}

std::string to_display_string(const Buf& value) {
    return to_display_string(value.to_slice());
}

std::string to_debug_string(const Slice& value) {
    if (const auto* text = value.if_text()) {
        return debug_text(*text);
    }
    return debug_bytes(*value.if_bytes());
}

std::string to_debug_string(const Buf& value) {
    return to_debug_string(value.to_slice());
}

std::ostream& operator<<(std::ostream& os, const Slice& value) {
    const CowText shown = value.as_cow_lossy();
    return os.write(shown.view().data(), static_cast<std::streamsize>(shown.size()));
}

std::ostream& operator<<(std::ostream& os, const Buf& value) {
    return os << value.to_slice();
}

} // namespace maybe_utf8
