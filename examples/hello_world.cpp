/// @file examples/hello_world.cpp
/// @brief Parse a temporal point from WKT and print it as WKT, MF-JSON and WKB.

#include "tempus/mfjson.hpp"
#include "tempus/wkb.hpp"
#include "tempus/wkt.hpp"

#include <fmt/core.h>

int main() {
    const char* input =
        "SRID=4326;[POINT(1 1)@2000-01-01 08:00:00+00, POINT(2 2)@2000-01-01 08:05:00+00]";

    auto parsed = tempus::codec::temporal_from_wkt(input, tempus::ValueType::GeomPoint);
    if (!parsed) {
        fmt::print(stderr, "Error: {}\n", tempus::to_string(parsed.error()));
        return 1;
    }
    const tempus::Temporal& trip = *parsed;

    fmt::print("WKT:     {}\n", tempus::codec::to_wkt(trip));

    tempus::codec::CodecConfig cfg;
    cfg.precision  = 6;
    cfg.json_style = tempus::codec::JsonStyle::Pretty;
    cfg.with_bbox  = true;
    fmt::print("MF-JSON:\n{}\n", tempus::codec::to_mfjson(trip, cfg));

    fmt::print("WKB:     {}\n", tempus::codec::to_hex(tempus::codec::to_wkb(trip)));

    const auto& seq = std::get<tempus::TSequence>(trip);
    if (auto length = seq.length()) {
        fmt::print("Length:  {:.6f}\n", *length);
    }
    return 0;
}
