/**
 * @file fuzz_utf8_width.cpp
 * @brief LibFuzzer target for string width over arbitrary bytes.
 */

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

#include "termwidth.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    constexpr size_t MAX_INPUT_SIZE = 64 * 1024;
    if (size > MAX_INPUT_SIZE) size = MAX_INPUT_SIZE;

    static const termwidth::WidthClassifier classifier(termwidth::TableStore::builtin(),
                                                       termwidth::ResolverOptions{});

    std::string_view text(reinterpret_cast<const char*>(data), size);
    int width = classifier.utf8_width(text, std::nullopt, "latest");

    // The same text decoded up front must measure identically
    std::u32string decoded = termwidth::utf8_to_utf32(text);
    if (classifier.string_width(decoded, std::nullopt, "latest") != width) std::abort();

    if (width >= 0 && static_cast<size_t>(width) > 2 * decoded.size()) std::abort();

    // Limit is a prefix: never wider than the whole string
    if (width >= 0) {
        int half = classifier.utf8_width(text, decoded.size() / 2, "latest");
        if (half < 0 || half > width) std::abort();
    }

    return 0;
}
