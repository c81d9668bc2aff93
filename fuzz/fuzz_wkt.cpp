/**
 * @file  fuzz_wkt.cpp
 * @brief libFuzzer target for the WKT reader
 *
 * Build:
 *   cmake -DTEMPUS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_wkt
 *
 * Run for 60 seconds:
 *   ./fuzz_wkt -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. A parse failure of kind Parse carries a position within the input.
 *   3. Rendering is canonical: every accepted value re-renders to WKT that
 *      parses back and renders to the same text.
 *
 * Fuzzer strategy:
 *   The first byte selects the value type; the rest is the text. Inputs
 *   worth exploring include unbalanced brackets, stray '@', SRID prefixes,
 *   Interp= prefixes, out-of-range dates and very long digit runs.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "tempus/wkt.hpp"

using namespace tempus;
using namespace tempus::codec;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size == 0) return 0;
    static constexpr ValueType types[] = {
        ValueType::Bool, ValueType::Int, ValueType::Float,
        ValueType::Text, ValueType::GeomPoint, ValueType::GeogPoint,
    };
    const ValueType type = types[data[0] % 6];
    const std::string_view input{reinterpret_cast<const char*>(data + 1), size - 1};

    const auto result = temporal_from_wkt(input, type);
    if (!result) {
        // Invariant 2
        if (result.error().kind == ErrorKind::Parse) {
            assert(result.error().parse.has_value());
            assert(result.error().parse->position <= input.size());
        }
        return 0;
    }

    // Invariant 3
    assert(value_type_of(*result) == type);
    const std::string text = to_wkt(*result);
    const auto again = temporal_from_wkt(text, type);
    assert(again.has_value());
    assert(to_wkt(*again) == text);

    // Span readers share the scanner
    (void)span_from_wkt<double>(input);
    (void)span_set_from_wkt<std::int64_t>(input);
    return 0;
}
