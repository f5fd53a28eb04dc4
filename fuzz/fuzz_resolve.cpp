/**
 * @file fuzz_resolve.cpp
 * @brief LibFuzzer target for Unicode version token resolution.
 */

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "termwidth.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    constexpr size_t MAX_TOKEN_SIZE = 256;
    if (size > MAX_TOKEN_SIZE) size = MAX_TOKEN_SIZE;

    const termwidth::TableStore& store = termwidth::TableStore::builtin();
    termwidth::VersionResolver resolver(store);
    std::string token(reinterpret_cast<const char*>(data), size);

    try {
        std::string resolved = resolver.resolve(token);
        if (!store.contains(resolved)) std::abort();
        // A resolved version resolves to itself
        if (resolver.resolve(resolved) != resolved) std::abort();
    } catch (const termwidth::TermwidthException& e) {
        if (e.code() != termwidth::ErrorCode::MALFORMED_VERSION) std::abort();
    }

    return 0;
}
