#include "maybe_utf8/iconv_decoder.hpp"

#include "maybe_utf8/lossy.hpp"

#include <cerrno>
#include <utility>

namespace maybe_utf8 {

namespace {

const iconv_t kInvalidHandle = reinterpret_cast<iconv_t>(-1);
constexpr std::size_t kIconvError = static_cast<std::size_t>(-1);
constexpr std::size_t kMinOutputBytes = 16;

bool is_alnum(char c) noexcept {
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9');
}

} // namespace

bool validate_encoding_name(std::string_view name) noexcept {
    if (name.empty() || name.size() > DecoderLimits::kMaxEncodingNameLen) {
        return false;
    }
    if (!is_alnum(name[0])) {
        return false;
    }
    for (char c : name.substr(1)) {
        bool valid = is_alnum(c) || c == '.' || c == '_' || c == ':' || c == '-';
        if (!valid) {
            return false;
        }
    }
    return true;
}

OpenResult IconvDecoder::open(const DecoderConfig& config) {
    if (!validate_encoding_name(config.source_encoding)) {
        return DecoderError::InvalidName;
    }

    // iconv_open needs NUL-terminated names.
    const std::string from(config.source_encoding);
    iconv_t cd = ::iconv_open("UTF-8", from.c_str());
    if (cd == kInvalidHandle) {
        return DecoderError::UnsupportedEncoding;
    }
    return IconvDecoder(cd, config.on_invalid);
}

IconvDecoder::IconvDecoder(IconvDecoder&& other) noexcept
    : cd_(std::exchange(other.cd_, kInvalidHandle))
    , mode_(other.mode_) {}

IconvDecoder& IconvDecoder::operator=(IconvDecoder&& other) noexcept {
    if (this != &other) {
        close();
        cd_ = std::exchange(other.cd_, kInvalidHandle);
        mode_ = other.mode_;
    }
    return *this;
}

IconvDecoder::~IconvDecoder() {
    close();
}

void IconvDecoder::close() noexcept {
    if (cd_ != kInvalidHandle) {
        ::iconv_close(cd_);
        cd_ = kInvalidHandle;
    }
}

DecodeResult IconvDecoder::decode(ByteView input) {
    return convert(input, mode_);
}

std::string IconvDecoder::operator()(ByteView input) {
    auto result = convert(input, InvalidInputMode::Replace);
    if (auto* text = std::get_if<std::string>(&result)) {
        return std::move(*text);
    }
    // Only ConverterError gets here (moved-from decoder, broken iconv);
    // fall back to reading the input as UTF-8.
    return decode_lossy(input);
}

DecodeResult IconvDecoder::convert(ByteView input, InvalidInputMode mode) {
    if (cd_ == kInvalidHandle) {
        return DecodeError{DecodeErrorReason::ConverterError, 0};
    }

    // Reset shift state left over from a previous call. Cannot fail.
    ::iconv(cd_, nullptr, nullptr, nullptr, nullptr);

    std::string out;
    out.resize(input.size() * 2 < kMinOutputBytes ? kMinOutputBytes : input.size() * 2);
    std::size_t written = 0;

    // iconv(3) takes char** but does not write through the input pointer.
    char* in = const_cast<char*>(reinterpret_cast<const char*>(input.data()));
    std::size_t in_left = input.size();

    auto grow = [&out]() { out.resize(out.size() * 2); };

    while (in_left > 0) {
        char* out_ptr = out.data() + written;
        std::size_t out_left = out.size() - written;
        const std::size_t rc = ::iconv(cd_, &in, &in_left, &out_ptr, &out_left);
        written = static_cast<std::size_t>(out_ptr - out.data());
        if (rc != kIconvError) {
            break;
        }

        const int err = errno;
        const std::size_t offset = input.size() - in_left;
        if (err == E2BIG) {
            grow();
            continue;
        }
        if (err == EILSEQ || err == EINVAL) {
            if (mode == InvalidInputMode::Strict) {
                return DecodeError{
                    err == EILSEQ ? DecodeErrorReason::InvalidInput
                                  : DecodeErrorReason::IncompleteInput,
                    offset};
            }
            // Skip one offending byte.
            while (out.size() - written < kReplacementChar.size()) {
                grow();
            }
            out.replace(written, kReplacementChar.size(), kReplacementChar);
            written += kReplacementChar.size();
            ++in;
            --in_left;
            continue;
        }
        return DecodeError{DecodeErrorReason::ConverterError, offset};
    }

    // Flush any pending shift sequence.
    for (;;) {
        char* out_ptr = out.data() + written;
        std::size_t out_left = out.size() - written;
        const std::size_t rc = ::iconv(cd_, nullptr, nullptr, &out_ptr, &out_left);
        written = static_cast<std::size_t>(out_ptr - out.data());
        if (rc != kIconvError) {
            break;
        }
        if (errno != E2BIG) {
            return DecodeError{DecodeErrorReason::ConverterError, input.size()};
        }
        grow();
    }

    out.resize(written);
    return out;
}

} // namespace maybe_utf8
