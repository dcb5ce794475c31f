#pragma once

#include "maybe_utf8/types.hpp"

#include <cstddef>
#include <string>

namespace maybe_utf8 {

// ============================================================================
// UTF-8 validation and lossy decoding.
//
// Pure functions over raw bytes. Nothing here allocates except
// decode_lossy / append_lossy, which build the output string.
// ============================================================================

// U+FFFD REPLACEMENT CHARACTER, UTF-8 encoded.
inline constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

// True if the whole sequence is well-formed UTF-8 (no overlongs,
// no surrogates, nothing above U+10FFFF).
bool is_valid_utf8(ByteView bytes) noexcept;

// Length of the longest well-formed UTF-8 prefix.
// Equals bytes.size() iff is_valid_utf8(bytes).
std::size_t valid_up_to(ByteView bytes) noexcept;

// Decode bytes as UTF-8, substituting U+FFFD for each maximal subpart of
// an ill-formed sequence: a lead byte plus the continuation bytes still
// acceptable after it. So "\xE2\x82x" gives one U+FFFD before 'x', while
// the surrogate "\xED\xA0\x80" gives three. Never fails. Valid input is returned unchanged, so the
// function is idempotent on its own output.
std::string decode_lossy(ByteView bytes);

// Same as decode_lossy, appending to `out`.
void append_lossy(ByteView bytes, std::string& out);

} // namespace maybe_utf8
