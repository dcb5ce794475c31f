#pragma once

#include "maybe_utf8/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <iconv.h>

namespace maybe_utf8 {

// ============================================================================
// Legacy-encoding decoder backed by iconv(3).
//
// Not used by Buf/Slice themselves. It is one ready-made `decode` function
// for Buf::map_into_str and Slice::map_as_cow, for callers who know which
// encoding their bytes are in (e.g. ZIP entries without the UTF-8 flag).
// ============================================================================

struct DecoderLimits {
    static constexpr std::size_t kMaxEncodingNameLen = 64;
};

// What to do with input bytes the source encoding cannot map.
enum class InvalidInputMode : std::uint8_t {
    // Emit U+FFFD and skip ONE input byte, then continue. Right for
    // byte-oriented sources (ISO-8859-x, CP437, Shift_JIS, UTF-8). For
    // fixed-width multi-byte sources (UTF-16, UTF-32, UCS-2) a one-byte skip
    // misaligns later code units; use Strict for those.
    Replace,
    Strict,   // stop and report DecodeErrorReason
};

struct DecoderConfig {
    std::string_view source_encoding = "ISO-8859-1";
    InvalidInputMode on_invalid = InvalidInputMode::Replace;
};

inline constexpr DecoderConfig kDefaultDecoderConfig = {
    .source_encoding = "ISO-8859-1",
    .on_invalid = InvalidInputMode::Replace,
};

// Encoding names as iconv accepts them: ^[A-Za-z0-9][A-Za-z0-9._:-]{0,63}$
bool validate_encoding_name(std::string_view name) noexcept;

// open() failures
enum class DecoderError : std::uint8_t {
    InvalidName,          // fails validate_encoding_name
    UnsupportedEncoding,  // iconv_open does not know it
};

enum class DecodeErrorReason : std::uint8_t {
    InvalidInput,     // byte sequence not valid in the source encoding
    IncompleteInput,  // input ends inside a multi-byte sequence
    ConverterError,   // any other iconv failure
};

struct DecodeError {
    DecodeErrorReason reason;
    std::size_t offset;  // input offset where conversion stopped
};

using DecodeResult = std::variant<std::string, DecodeError>;

class IconvDecoder;
using OpenResult = std::variant<IconvDecoder, DecoderError>;

// Owns one iconv_t converting `source_encoding` to UTF-8.
//
// Thread safety: NOT thread-safe. iconv_t carries conversion state;
// use one decoder per thread.
class IconvDecoder {
public:
    static OpenResult open(const DecoderConfig& config = kDefaultDecoderConfig);

    IconvDecoder(const IconvDecoder&) = delete;
    IconvDecoder& operator=(const IconvDecoder&) = delete;
    IconvDecoder(IconvDecoder&& other) noexcept;
    IconvDecoder& operator=(IconvDecoder&& other) noexcept;
    ~IconvDecoder();

    // Convert the whole input, honouring the configured InvalidInputMode.
    [[nodiscard]] DecodeResult decode(ByteView input);

    // decode_fn adapters. Always replace, never fail, so they can be passed
    // straight to map_into_str / map_as_cow.
    std::string operator()(ByteView input);
    std::string operator()(const ByteBuf& input) { return (*this)(ByteView(input)); }

    [[nodiscard]] InvalidInputMode mode() const noexcept { return mode_; }

private:
    IconvDecoder(iconv_t cd, InvalidInputMode mode) noexcept : cd_(cd), mode_(mode) {}

    DecodeResult convert(ByteView input, InvalidInputMode mode);
    void close() noexcept;

    iconv_t cd_;
    InvalidInputMode mode_;
};

} // namespace maybe_utf8
