#pragma once

#include "maybe_utf8/buf.hpp"
#include "maybe_utf8/slice.hpp"

#include <iosfwd>
#include <string>

namespace maybe_utf8 {

// ============================================================================
// Rendering for humans and for diagnostics. Neither mutates its input.
//
// Display: lossy. Text is written as is; Bytes are decoded as UTF-8 with
//          U+FFFD for each maximal ill-formed subpart.
// Debug:   unambiguous. Text is a double-quoted literal, Bytes are
//          b"..." with every non-printable or non-ASCII byte as \xNN:
//
//            Text  "café"          -> "café"
//            Bytes {'c','a','f',0xE9}   -> b"caf\xe9"
// ============================================================================

std::string to_display_string(const Slice& value);
std::string to_display_string(const Buf& value);

std::string to_debug_string(const Slice& value);
std::string to_debug_string(const Buf& value);

// Writes the display form.
std::ostream& operator<<(std::ostream& os, const Slice& value);
std::ostream& operator<<(std::ostream& os, const Buf& value);

} // namespace maybe_utf8
