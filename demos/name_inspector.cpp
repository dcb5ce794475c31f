// Name Inspector Demo
//
// Reads names as raw bytes (one per line, or NUL-separated with -0), the way
// an archive lister would hand them over, and prints for each:
//   kind    display form    debug form    [decoded form]
//
// Usage:
//   ./name_inspector [--encoding NAME] [--strict] [-0] < names.txt
//
// Options:
//   --encoding NAME - decode non-UTF-8 names from NAME via iconv
//   --strict        - report undecodable names instead of substituting U+FFFD
//   -0              - names are NUL-separated (e.g. `find -print0`)

#include "maybe_utf8/buf.hpp"
#include "maybe_utf8/format.hpp"
#include "maybe_utf8/iconv_decoder.hpp"
#include "maybe_utf8/into.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace {

struct Stats {
    std::uint64_t names = 0;
    std::uint64_t utf8 = 0;
    std::uint64_t non_utf8 = 0;
    std::uint64_t decoded = 0;
    std::uint64_t decode_failures = 0;
};

std::string_view decode_error_to_string(maybe_utf8::DecodeErrorReason reason) {
    switch (reason) {
        case maybe_utf8::DecodeErrorReason::InvalidInput:    return "invalid input";
        case maybe_utf8::DecodeErrorReason::IncompleteInput: return "incomplete input";
        case maybe_utf8::DecodeErrorReason::ConverterError:  return "converter error";
    }
    return "unknown";
}

void inspect(maybe_utf8::Buf name, maybe_utf8::IconvDecoder* decoder, Stats& stats) {
    ++stats.names;

    // Names that happen to be UTF-8 are promoted; the rest stay Bytes.
    if (name.try_promote()) {
        ++stats.utf8;
    } else {
        ++stats.non_utf8;
    }

    const std::string display = maybe_utf8::to_display_string(name);
    const std::string debug = maybe_utf8::to_debug_string(name);
    std::printf("%s\t%s\t%s", maybe_utf8::kind_to_string(name.kind()).data(),
                display.c_str(), debug.c_str());

    if (decoder != nullptr && name.is_bytes()) {
        if (decoder->mode() == maybe_utf8::InvalidInputMode::Strict) {
            auto result = decoder->decode(name.as_bytes());
            if (const auto* text = std::get_if<std::string>(&result)) {
                std::printf("\t%s", text->c_str());
                ++stats.decoded;
            } else {
                const auto& err = std::get<maybe_utf8::DecodeError>(result);
                std::fprintf(stderr, "Cannot decode %s: %s at byte %zu\n", debug.c_str(),
                             decode_error_to_string(err.reason).data(), err.offset);
                ++stats.decode_failures;
            }
        } else {
            const std::string text = std::move(name).map_into_str(*decoder);
            std::printf("\t%s", text.c_str());
            ++stats.decoded;
        }
    }
    std::printf("\n");
}

void print_stats(const Stats& stats) {
    std::fprintf(stderr, "--- Name Stats ---\n");
    std::fprintf(stderr, "Names:           %lu\n", stats.names);
    std::fprintf(stderr, "UTF-8:           %lu\n", stats.utf8);
    std::fprintf(stderr, "Non-UTF-8:       %lu\n", stats.non_utf8);
    std::fprintf(stderr, "Decoded:         %lu\n", stats.decoded);
    std::fprintf(stderr, "Decode failures: %lu\n", stats.decode_failures);
    std::fprintf(stderr, "------------------\n");
}

} // namespace

int main(int argc, char* argv[]) {
    maybe_utf8::DecoderConfig config;
    bool use_decoder = false;
    int separator = '\n';

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--encoding") == 0 && i + 1 < argc) {
            config.source_encoding = argv[++i];
            use_decoder = true;
        } else if (std::strcmp(argv[i], "--strict") == 0) {
            config.on_invalid = maybe_utf8::InvalidInputMode::Strict;
        } else if (std::strcmp(argv[i], "-0") == 0) {
            separator = '\0';
        } else {
            std::fprintf(stderr, "Usage: %s [--encoding NAME] [--strict] [-0]\n", argv[0]);
            return EXIT_FAILURE;
        }
    }

    std::optional<maybe_utf8::IconvDecoder> decoder;
    if (use_decoder) {
        auto opened = maybe_utf8::IconvDecoder::open(config);
        if (auto* err = std::get_if<maybe_utf8::DecoderError>(&opened)) {
            std::fprintf(stderr, "Cannot decode from '%.*s': %s\n",
                         static_cast<int>(config.source_encoding.size()),
                         config.source_encoding.data(),
                         *err == maybe_utf8::DecoderError::InvalidName
                             ? "invalid encoding name" : "unsupported encoding");
            return EXIT_FAILURE;
        }
        decoder.emplace(std::move(std::get<maybe_utf8::IconvDecoder>(opened)));
    }

    Stats stats;
    maybe_utf8::ByteBuf current;
    int c = 0;
    while ((c = std::getchar()) != EOF) {
        if (c == separator) {
            inspect(maybe_utf8::into_maybe_utf8(std::exchange(current, {})),
                    decoder ? &*decoder : nullptr, stats);
            continue;
        }
        current.push_back(static_cast<std::byte>(c));
    }
    if (std::ferror(stdin)) {
        std::fprintf(stderr, "Failed to read stdin\n");
        return EXIT_FAILURE;
    }
    if (!current.empty()) {
        inspect(maybe_utf8::into_maybe_utf8(std::move(current)),
                decoder ? &*decoder : nullptr, stats);
    }

    print_stats(stats);
    return stats.decode_failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
