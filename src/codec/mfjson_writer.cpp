/// @file src/codec/mfjson_writer.cpp
/// @brief MF-JSON rendering of temporal values.

#include "tempus/mfjson.hpp"
#include "tempus/time.hpp"

#include "json.hpp"
#include "mfjson_common.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <optional>
#include <type_traits>

namespace tempus::codec {

namespace {

using detail::JsonValue;

/// Shortest text that reads back to `v`, or fixed-point with `precision`
/// decimals and trailing zeros dropped when a precision is requested.
JsonValue number(double v, std::optional<int> precision) {
    if (!std::isfinite(v)) return JsonValue{};
    if (!precision) {
        std::string text = fmt::format("{}", v);
        if (text == "-0") text = "0";
        return JsonValue::number(std::move(text));
    }
    std::string text = fmt::format("{:.{}f}", v, *precision);
    if (text.find('.') != std::string::npos) {
        while (text.back() == '0') text.pop_back();
        if (text.back() == '.') text.pop_back();
    }
    if (text == "-0") text = "0";
    return JsonValue::number(std::move(text));
}

JsonValue json_value(const Value& value, std::optional<int> precision) {
    return std::visit([&](const auto& v) -> JsonValue {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, bool>) {
            return JsonValue::boolean_value(v);
        } else if constexpr (std::is_same_v<V, std::int64_t>) {
            return JsonValue::number(fmt::format("{}", v));
        } else if constexpr (std::is_same_v<V, double>) {
            return number(v, precision);
        } else if constexpr (std::is_same_v<V, std::string>) {
            return JsonValue::string(v);
        } else {
            JsonValue coords = JsonValue::array();
            coords.items.push_back(number(v.x(), precision));
            coords.items.push_back(number(v.y(), precision));
            if (v.has_z) coords.items.push_back(number(v.z(), precision));
            return coords;
        }
    }, value);
}

JsonValue timestamp(Timestamp t) {
    return JsonValue::string(format_timestamp(t, 'T'));
}

/// `values`/`coordinates` and `datetimes` members for a run of instants.
void add_samples(JsonValue& obj, ValueType type, std::span<const TInstant> instants,
                 std::optional<int> precision) {
    JsonValue values    = JsonValue::array();
    JsonValue datetimes = JsonValue::array();
    for (const auto& i : instants) {
        values.items.push_back(json_value(i.value(), precision));
        datetimes.items.push_back(timestamp(i.timestamp()));
    }
    obj.add(is_spatial(type) ? "coordinates" : "values", std::move(values));
    obj.add("datetimes", std::move(datetimes));
}

void add_bounds(JsonValue& obj, bool lower_inc, bool upper_inc) {
    obj.add("lower_inc", JsonValue::boolean_value(lower_inc));
    obj.add("upper_inc", JsonValue::boolean_value(upper_inc));
}

/// First point of a spatial value, used for its SRID.
const Point* sample_point(const Temporal& temporal) noexcept {
    return std::visit([](const auto& t) -> const Point* {
        using V = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<V, TInstant>) {
            return std::get_if<Point>(&t.value());
        } else if constexpr (std::is_same_v<V, TSequence>) {
            return std::get_if<Point>(&t.start_instant().value());
        } else {
            if (t.is_empty()) return nullptr;
            return std::get_if<Point>(&t.sequences().front().start_instant().value());
        }
    }, temporal);
}

void add_crs(JsonValue& obj, const Temporal& temporal, const CodecConfig& config) {
    std::string name = config.srs;
    if (name.empty()) {
        const Point* p = sample_point(temporal);
        if (!p || p->srid == constants::NO_SRID) return;
        name = fmt::format("EPSG:{}", p->srid);
    }
    JsonValue props = JsonValue::object();
    props.add("name", JsonValue::string(std::move(name)));
    JsonValue crs = JsonValue::object();
    crs.add("type", JsonValue::string("Name"));
    crs.add("properties", std::move(props));
    obj.add("crs", std::move(crs));
}

std::vector<TInstant> all_instants(const Temporal& temporal) {
    return std::visit([](const auto& t) -> std::vector<TInstant> {
        using V = std::decay_t<decltype(t)>;
        if constexpr (std::is_same_v<V, TInstant>) {
            return {t};
        } else if constexpr (std::is_same_v<V, TSequence>) {
            return {t.instants().begin(), t.instants().end()};
        } else {
            return t.instants();
        }
    }, temporal);
}

/// `period` and, for numeric and spatial values, `bbox`.
void add_bbox(JsonValue& obj, const Temporal& temporal, std::optional<int> precision) {
    const auto period = bounding_box_of(temporal);
    if (!period) return;
    JsonValue p = JsonValue::object();
    p.add("begin", timestamp(period->lower()));
    p.add("end", timestamp(period->upper()));
    add_bounds(p, period->lower_inc(), period->upper_inc());
    obj.add("period", std::move(p));

    const ValueType type = value_type_of(temporal);
    const auto instants  = all_instants(temporal);
    if (is_numeric(type)) {
        double lo = as_double(instants.front().value());
        double hi = lo;
        for (const auto& i : instants) {
            lo = std::min(lo, as_double(i.value()));
            hi = std::max(hi, as_double(i.value()));
        }
        JsonValue box = JsonValue::array();
        box.items.push_back(number(lo, precision));
        box.items.push_back(number(hi, precision));
        obj.add("bbox", std::move(box));
    } else if (is_spatial(type)) {
        const Point& first = std::get<Point>(instants.front().value());
        Eigen::AlignedBox3d extent(first.coords, first.coords);
        for (const auto& i : instants) extent.extend(std::get<Point>(i.value()).coords);
        const auto corner = [&](const Eigen::Vector3d& c) {
            Point q = first;
            q.coords = c;
            return json_value(q, precision);
        };
        JsonValue box = JsonValue::array();
        box.items.push_back(corner(extent.min()));
        box.items.push_back(corner(extent.max()));
        obj.add("bbox", std::move(box));
    }
}

}  // namespace

std::string to_mfjson(const Temporal& temporal, const CodecConfig& config) {
    std::optional<int> precision;
    if (config.precision) precision = std::clamp(*config.precision, 0, constants::MAX_PRECISION);
    const ValueType type = value_type_of(temporal);

    JsonValue root = JsonValue::object();
    root.add("type", JsonValue::string(detail::moving_type_name(type)));
    if (is_spatial(type)) add_crs(root, temporal, config);
    if (config.with_bbox) add_bbox(root, temporal, precision);

    if (const auto* i = std::get_if<TInstant>(&temporal)) {
        add_samples(root, type, std::span<const TInstant>(i, 1), precision);
    } else if (const auto* s = std::get_if<TSequence>(&temporal)) {
        add_samples(root, type, s->instants(), precision);
        add_bounds(root, s->lower_inc(), s->upper_inc());
    } else {
        const auto& set = std::get<TSequenceSet>(temporal);
        JsonValue sequences = JsonValue::array();
        for (const auto& member : set.sequences()) {
            JsonValue m = JsonValue::object();
            add_samples(m, type, member.instants(), precision);
            add_bounds(m, member.lower_inc(), member.upper_inc());
            sequences.items.push_back(std::move(m));
        }
        root.add("sequences", std::move(sequences));
    }
    root.add("interpolation", JsonValue::string(to_string(interpolation_of(temporal))));

    return detail::render_json(root, config.json_style == JsonStyle::Pretty);
}

}  // namespace tempus::codec
