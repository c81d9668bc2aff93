/// @file src/codec/mfjson_reader.cpp
/// @brief Strict MF-JSON reader.

#include "tempus/mfjson.hpp"
#include "tempus/time.hpp"

#include "json.hpp"
#include "mfjson_common.hpp"

#include <fmt/format.h>

#include <charconv>
#include <utility>
#include <vector>

namespace tempus::codec {

namespace {

using detail::JsonValue;
using Kind = JsonValue::Kind;

Error json_error(const JsonValue& at, std::string reason) {
    return Error::parse_error(Format::MfJson, at.position, std::move(reason));
}

/// Member `key` of `obj` with the given kind.
Result<const JsonValue*> member(const JsonValue& obj, std::string_view key, Kind kind) {
    const JsonValue* v = obj.find(key);
    if (!v) return json_error(obj, fmt::format("missing member \"{}\"", key));
    if (v->kind != kind) return json_error(*v, fmt::format("member \"{}\" has the wrong type", key));
    return v;
}

Result<double> read_double(const JsonValue& v) {
    if (v.kind != Kind::Number) return json_error(v, "expected a number");
    double out = 0.0;
    const char* first = v.text.data();
    const char* last  = first + v.text.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) return json_error(v, "number out of range");
    return out;
}

/// SRID of `EPSG:n` or `urn:ogc:def:crs:EPSG::n`; 0 for other names.
std::int32_t srid_from_name(std::string_view name) noexcept {
    for (std::string_view prefix : {std::string_view{"EPSG:"},
                                    std::string_view{"urn:ogc:def:crs:EPSG::"}}) {
        if (name.substr(0, prefix.size()) != prefix) continue;
        const std::string_view digits = name.substr(prefix.size());
        std::int32_t srid = 0;
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), srid);
        if (ec == std::errc{} && ptr == digits.data() + digits.size()) return srid;
    }
    return constants::NO_SRID;
}

Result<std::int32_t> read_srid(const JsonValue& root) {
    const JsonValue* crs = root.find("crs");
    if (!crs) return constants::NO_SRID;
    if (crs->kind != Kind::Object) return json_error(*crs, "\"crs\" must be an object");
    auto props = member(*crs, "properties", Kind::Object);
    if (!props) return std::move(props).error();
    auto name = member(**props, "name", Kind::String);
    if (!name) return std::move(name).error();
    return srid_from_name((*name)->text);
}

struct ReadContext {
    ValueType    type;
    std::int32_t srid;
};

Result<Value> read_value(const JsonValue& v, const ReadContext& ctx) {
    switch (ctx.type) {
        case ValueType::Bool:
            if (v.kind != Kind::Bool) return json_error(v, "expected a boolean");
            return v.boolean;
        case ValueType::Int: {
            if (v.kind != Kind::Number) return json_error(v, "expected an integer");
            std::int64_t out = 0;
            const char* last = v.text.data() + v.text.size();
            const auto [ptr, ec] = std::from_chars(v.text.data(), last, out);
            if (ec != std::errc{} || ptr != last) return json_error(v, "expected an integer");
            return out;
        }
        case ValueType::Float: {
            auto d = read_double(v);
            if (!d) return std::move(d).error();
            return *d;
        }
        case ValueType::Text:
            if (v.kind != Kind::String) return json_error(v, "expected a string");
            return v.text;
        case ValueType::GeomPoint:
        case ValueType::GeogPoint: {
            if (v.kind != Kind::Array || v.items.size() < 2 || v.items.size() > 3) {
                return json_error(v, "expected 2 or 3 coordinates");
            }
            double c[3] = {0.0, 0.0, 0.0};
            for (std::size_t i = 0; i < v.items.size(); ++i) {
                auto d = read_double(v.items[i]);
                if (!d) return std::move(d).error();
                c[i] = *d;
            }
            Point p = v.items.size() == 3 ? Point::xyz(c[0], c[1], c[2], ctx.srid)
                                          : Point::xy(c[0], c[1], ctx.srid);
            p.geodetic = ctx.type == ValueType::GeogPoint;
            return p;
        }
    }
    return json_error(v, "unknown value type");
}

/// Paired `values`/`coordinates` and `datetimes` arrays of one object.
Result<std::vector<TInstant>> read_samples(const JsonValue& obj, const ReadContext& ctx) {
    auto values = member(obj, is_spatial(ctx.type) ? "coordinates" : "values", Kind::Array);
    if (!values) return std::move(values).error();
    auto datetimes = member(obj, "datetimes", Kind::Array);
    if (!datetimes) return std::move(datetimes).error();
    const auto& vs = (*values)->items;
    const auto& ts = (*datetimes)->items;
    if (vs.size() != ts.size()) {
        return json_error(**datetimes, fmt::format("{} values but {} datetimes",
                                                   vs.size(), ts.size()));
    }
    std::vector<TInstant> out;
    out.reserve(vs.size());
    for (std::size_t i = 0; i < vs.size(); ++i) {
        auto value = read_value(vs[i], ctx);
        if (!value) return std::move(value).error();
        if (ts[i].kind != Kind::String) return json_error(ts[i], "expected a datetime string");
        auto t = parse_timestamp(ts[i].text);
        if (!t) return json_error(ts[i], t.error().message);
        out.emplace_back(std::move(*value), *t);
    }
    return out;
}

Result<bool> read_flag(const JsonValue& obj, std::string_view key, bool required) {
    const JsonValue* v = obj.find(key);
    if (!v) {
        if (required) return json_error(obj, fmt::format("missing member \"{}\"", key));
        return true;
    }
    if (v->kind != Kind::Bool) return json_error(*v, fmt::format("member \"{}\" must be a boolean", key));
    return v->boolean;
}

Result<TSequence> read_sequence(const JsonValue& obj, const ReadContext& ctx,
                                Interpolation interp) {
    auto instants = read_samples(obj, ctx);
    if (!instants) return std::move(instants).error();
    const bool required = interp != Interpolation::Discrete;
    auto lower_inc = read_flag(obj, "lower_inc", required);
    if (!lower_inc) return std::move(lower_inc).error();
    auto upper_inc = read_flag(obj, "upper_inc", required);
    if (!upper_inc) return std::move(upper_inc).error();
    return TSequence::make(std::move(*instants), interp, *lower_inc, *upper_inc);
}

}  // namespace

Result<Temporal> temporal_from_mfjson(std::string_view json) {
    auto doc = detail::parse_json(json);
    if (!doc) return std::move(doc).error();
    const JsonValue& root = *doc;
    if (root.kind != Kind::Object) return json_error(root, "document must be an object");

    auto type_name = member(root, "type", Kind::String);
    if (!type_name) return std::move(type_name).error();
    const auto type = detail::moving_type((*type_name)->text);
    if (!type) {
        return json_error(**type_name, fmt::format("unknown type \"{}\"", (*type_name)->text));
    }

    auto interp_name = member(root, "interpolation", Kind::String);
    if (!interp_name) return std::move(interp_name).error();
    const auto interp = detail::interpolation_named((*interp_name)->text);
    if (!interp) {
        return json_error(**interp_name,
                          fmt::format("unknown interpolation \"{}\"", (*interp_name)->text));
    }

    auto srid = read_srid(root);
    if (!srid) return std::move(srid).error();
    const ReadContext ctx{*type, is_spatial(*type) ? *srid : constants::NO_SRID};

    if (const JsonValue* sequences = root.find("sequences")) {
        if (sequences->kind != Kind::Array) return json_error(*sequences, "\"sequences\" must be an array");
        if (*interp == Interpolation::None) {
            return json_error(**interp_name, "sequence set cannot have interpolation None");
        }
        if (sequences->items.empty()) return Temporal(TSequenceSet::empty(*type, *interp));
        std::vector<TSequence> members;
        members.reserve(sequences->items.size());
        for (const auto& m : sequences->items) {
            if (m.kind != Kind::Object) return json_error(m, "sequence must be an object");
            auto seq = read_sequence(m, ctx, *interp);
            if (!seq) return std::move(seq).error();
            members.push_back(std::move(*seq));
        }
        auto set = TSequenceSet::make(std::move(members));
        if (!set) return std::move(set).error();
        return Temporal(std::move(*set));
    }

    if (*interp == Interpolation::None) {
        auto instants = read_samples(root, ctx);
        if (!instants) return std::move(instants).error();
        if (instants->size() != 1) return json_error(root, "instant must have exactly one sample");
        return Temporal(std::move(instants->front()));
    }

    auto seq = read_sequence(root, ctx, *interp);
    if (!seq) return std::move(seq).error();
    return Temporal(std::move(*seq));
}

}  // namespace tempus::codec
