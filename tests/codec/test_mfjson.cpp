/// @file tests/codec/test_mfjson.cpp
/// @brief Tests for the MF-JSON codec: writer shapes, reader leniency, errors.

#include "tempus/mfjson.hpp"
#include "tempus/time.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

using namespace tempus;
using namespace tempus::codec;

namespace {

Timestamp ts(unsigned day, unsigned hour = 0) {
    return *make_timestamp(2000, 1, day, hour);
}

TSequence float_seq(Interpolation interp = Interpolation::Linear) {
    return *TSequence::make({TInstant(1.0, ts(1)), TInstant(2.5, ts(2))}, interp);
}

Temporal read(std::string_view json) {
    auto r = temporal_from_mfjson(json);
    EXPECT_TRUE(r.has_value()) << (r ? "" : to_string(r.error()));
    return *r;
}

ErrorKind read_error(std::string_view json) {
    auto r = temporal_from_mfjson(json);
    EXPECT_FALSE(r.has_value()) << json;
    return r ? ErrorKind::InvalidArgument : r.error().kind;
}

}  // namespace

// ─── Writer ───────────────────────────────────────────────────────────────────

TEST(MfJsonWrite, CompactFloatSequence) {
    EXPECT_EQ(to_mfjson(float_seq()),
              R"({"type":"MovingFloat","values":[1,2.5],)"
              R"("datetimes":["2000-01-01T00:00:00+00","2000-01-02T00:00:00+00"],)"
              R"("lower_inc":true,"upper_inc":true,"interpolation":"Linear"})");
}

TEST(MfJsonWrite, Instant) {
    EXPECT_EQ(to_mfjson(TInstant(1.5, ts(1, 8))),
              R"({"type":"MovingFloat","values":[1.5],)"
              R"("datetimes":["2000-01-01T08:00:00+00"],"interpolation":"None"})");
}

TEST(MfJsonWrite, SequenceSet) {
    auto a = *TSequence::make({TInstant(std::int64_t{1}, ts(1)), TInstant(std::int64_t{2}, ts(2))},
                              Interpolation::Step, true, false);
    auto b = *TSequence::make({TInstant(std::int64_t{3}, ts(3))}, Interpolation::Step);
    auto set = *TSequenceSet::make({a, b});
    EXPECT_EQ(to_mfjson(set),
              R"({"type":"MovingInteger","sequences":[)"
              R"({"values":[1,2],"datetimes":["2000-01-01T00:00:00+00","2000-01-02T00:00:00+00"],)"
              R"("lower_inc":true,"upper_inc":false},)"
              R"({"values":[3],"datetimes":["2000-01-03T00:00:00+00"],)"
              R"("lower_inc":true,"upper_inc":true}],"interpolation":"Step"})");
}

TEST(MfJsonWrite, PointCarriesCrs) {
    const TInstant i(Point::xy(1.0, 2.0, 4326), ts(1));
    EXPECT_EQ(to_mfjson(i),
              R"({"type":"MovingPoint","crs":{"type":"Name","properties":{"name":"EPSG:4326"}},)"
              R"("coordinates":[[1,2]],"datetimes":["2000-01-01T00:00:00+00"],)"
              R"("interpolation":"None"})");
}

TEST(MfJsonWrite, PointWithoutSridHasNoCrs) {
    const TInstant i(Point::xyz(1.0, 2.0, 3.0), ts(1));
    const std::string json = to_mfjson(i);
    EXPECT_EQ(json.find("crs"), std::string::npos);
    EXPECT_NE(json.find("[[1,2,3]]"), std::string::npos);
}

TEST(MfJsonWrite, ConfiguredSrsOverridesSrid) {
    CodecConfig cfg;
    cfg.srs = "urn:ogc:def:crs:EPSG::3857";
    const std::string json = to_mfjson(TInstant(Point::xy(1.0, 2.0, 4326), ts(1)), cfg);
    EXPECT_NE(json.find(R"("name":"urn:ogc:def:crs:EPSG::3857")"), std::string::npos);
}

TEST(MfJsonWrite, PeriodAndBbox) {
    CodecConfig cfg;
    cfg.with_bbox = true;
    EXPECT_EQ(to_mfjson(float_seq(), cfg),
              R"({"type":"MovingFloat",)"
              R"("period":{"begin":"2000-01-01T00:00:00+00","end":"2000-01-02T00:00:00+00",)"
              R"("lower_inc":true,"upper_inc":true},"bbox":[1,2.5],)"
              R"("values":[1,2.5],"datetimes":["2000-01-01T00:00:00+00","2000-01-02T00:00:00+00"],)"
              R"("lower_inc":true,"upper_inc":true,"interpolation":"Linear"})");
}

TEST(MfJsonWrite, PointBboxCorners) {
    CodecConfig cfg;
    cfg.with_bbox = true;
    auto seq = *TSequence::make({TInstant(Point::xy(3.0, 1.0), ts(1)),
                                 TInstant(Point::xy(1.0, 4.0), ts(2))},
                                Interpolation::Linear);
    EXPECT_NE(to_mfjson(seq, cfg).find(R"("bbox":[[1,1],[3,4]])"), std::string::npos);
}

TEST(MfJsonWrite, PrecisionTrimsTrailingZeros) {
    CodecConfig cfg;
    cfg.precision = 2;
    EXPECT_NE(to_mfjson(TInstant(1.23456, ts(1)), cfg).find(R"("values":[1.23])"),
              std::string::npos);
    cfg.precision = 0;
    EXPECT_NE(to_mfjson(TInstant(2.4, ts(1)), cfg).find(R"("values":[2])"), std::string::npos);
    EXPECT_NE(to_mfjson(TInstant(-0.0001, ts(1)), cfg).find(R"("values":[0])"), std::string::npos);
}

TEST(MfJsonWrite, DefaultNumbersReadBackExactly) {
    const double sum   = 0.1 + 0.2;
    const double small = 1.234567890123456e-9;
    const double large = 1.0e300;
    for (const double v : {sum, small, large, -2.5}) {
        const TInstant i(v, ts(1));
        const Temporal back = read(to_mfjson(i));
        EXPECT_EQ(std::get<TInstant>(back).value(), Value(v)) << to_mfjson(i);
    }
    EXPECT_NE(to_mfjson(TInstant(sum, ts(1))).find(R"("values":[0.30000000000000004])"),
              std::string::npos);
}

TEST(MfJsonWrite, ExplicitPrecisionStillRounds) {
    CodecConfig cfg;
    cfg.precision = 3;
    const Temporal back = read(to_mfjson(TInstant(1.234567890123456e-9, ts(1)), cfg));
    EXPECT_EQ(std::get<TInstant>(back).value(), Value(0.0));
}

TEST(MfJsonWrite, NonFiniteIsNull) {
    const TInstant i(std::numeric_limits<double>::quiet_NaN(), ts(1));
    EXPECT_NE(to_mfjson(i).find(R"("values":[null])"), std::string::npos);
    EXPECT_EQ(read_error(to_mfjson(i)), ErrorKind::Parse);
}

TEST(MfJsonWrite, TextAndBoolValues) {
    const std::string text = to_mfjson(TInstant(std::string("say \"hi\"\n"), ts(1)));
    EXPECT_NE(text.find(R"("values":["say \"hi\"\n"])"), std::string::npos);
    const std::string flag = to_mfjson(TInstant(true, ts(1)));
    EXPECT_NE(flag.find(R"("type":"MovingBoolean","values":[true])"), std::string::npos);
}

TEST(MfJsonWrite, PrettyLayout) {
    CodecConfig cfg;
    cfg.json_style = JsonStyle::Pretty;
    EXPECT_EQ(to_mfjson(TInstant(1.5, ts(1)), cfg),
              "{\n"
              "  \"type\": \"MovingFloat\",\n"
              "  \"values\": [1.5],\n"
              "  \"datetimes\": [\"2000-01-01T00:00:00+00\"],\n"
              "  \"interpolation\": \"None\"\n"
              "}");
}

TEST(MfJsonWrite, PrettyAndCompactReadTheSame) {
    auto a = *TSequence::make({TInstant(Point::xy(1.0, 1.0, 4326), ts(1)),
                               TInstant(Point::xy(2.0, 2.0, 4326), ts(2))},
                              Interpolation::Linear, true, false);
    auto b = *TSequence::make({TInstant(Point::xy(5.0, 5.0, 4326), ts(3)),
                               TInstant(Point::xy(6.0, 5.0, 4326), ts(4))},
                              Interpolation::Linear);
    const Temporal set = *TSequenceSet::make({a, b});
    CodecConfig pretty;
    pretty.json_style = JsonStyle::Pretty;
    pretty.with_bbox  = true;
    EXPECT_EQ(read(to_mfjson(set, pretty)), read(to_mfjson(set)));
    EXPECT_EQ(read(to_mfjson(set)), set);
}

// ─── Reader ───────────────────────────────────────────────────────────────────

TEST(MfJsonRead, FloatSequence) {
    const Temporal t = read(R"({"type":"MovingFloat","values":[1,2.5],
        "datetimes":["2000-01-01T00:00:00Z","2000-01-02 00:00:00+00"],
        "lower_inc":true,"upper_inc":false,"interpolation":"Linear"})");
    ASSERT_TRUE(std::holds_alternative<TSequence>(t));
    const auto& seq = std::get<TSequence>(t);
    EXPECT_FALSE(seq.upper_inc());
    EXPECT_EQ(seq.value_at(ts(1, 12)).value(), Value(1.75));
}

TEST(MfJsonRead, CrsUrnForm) {
    const Temporal t = read(R"({"type":"MovingGeomPoint",
        "crs":{"type":"Name","properties":{"name":"urn:ogc:def:crs:EPSG::3857"}},
        "coordinates":[[1,2,3]],"datetimes":["2000-01-01T00:00:00+00"],
        "interpolation":"None"})");
    const auto& p = std::get<Point>(std::get<TInstant>(t).value());
    EXPECT_EQ(p.srid, 3857);
    EXPECT_TRUE(p.has_z);
    EXPECT_EQ(value_type_of(t), ValueType::GeomPoint);
}

TEST(MfJsonRead, GeographyPoints) {
    const Temporal t = read(R"({"type":"MovingGeogPoint",
        "crs":{"type":"Name","properties":{"name":"EPSG:4326"}},
        "coordinates":[[10,50],[11,51]],
        "datetimes":["2000-01-01T00:00:00+00","2000-01-02T00:00:00+00"],
        "lower_inc":true,"upper_inc":true,"interpolation":"Linear"})");
    const auto& seq = std::get<TSequence>(t);
    const auto& p   = std::get<Point>(seq.start_instant().value());
    EXPECT_TRUE(p.geodetic);
    EXPECT_EQ(p.srid, 4326);
}

TEST(MfJsonRead, UnknownCrsNameMeansNoSrid) {
    const Temporal t = read(R"({"type":"MovingPoint",
        "crs":{"type":"Name","properties":{"name":"local"}},
        "coordinates":[[1,2]],"datetimes":["2000-01-01T00:00:00+00"],
        "interpolation":"None"})");
    EXPECT_EQ(std::get<Point>(std::get<TInstant>(t).value()).srid, constants::NO_SRID);
}

TEST(MfJsonRead, DiscreteBoundsOptional) {
    const Temporal t = read(R"({"type":"MovingInteger","values":[1,2],
        "datetimes":["2000-01-01T00:00:00+00","2000-01-03T00:00:00+00"],
        "interpolation":"Discrete"})");
    const auto& seq = std::get<TSequence>(t);
    EXPECT_EQ(seq.interpolation(), Interpolation::Discrete);
    EXPECT_EQ(seq.value_at(ts(2)).error_kind(), ErrorKind::NoValueAtTimestamp);
}

TEST(MfJsonRead, EmptySequenceSet) {
    const Temporal t = read(R"({"type":"MovingFloat","sequences":[],"interpolation":"Step"})");
    const auto& set = std::get<TSequenceSet>(t);
    EXPECT_TRUE(set.is_empty());
    EXPECT_EQ(set.interpolation(), Interpolation::Step);
}

// ─── Errors ───────────────────────────────────────────────────────────────────

TEST(MfJsonError, MalformedJson) {
    auto r = temporal_from_mfjson(R"({"type":"MovingFloat",)");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Parse);
    ASSERT_TRUE(r.error().parse.has_value());
    EXPECT_EQ(r.error().parse->format, Format::MfJson);

    for (std::string_view bad : {"", "[]", "{", R"({"type":1})", R"({"type":"MovingFloat"} x)",
                                 R"({"type":"MovingFloat","values":[01]})"}) {
        EXPECT_EQ(read_error(bad), ErrorKind::Parse) << bad;
    }
}

TEST(MfJsonError, MissingMembers) {
    EXPECT_EQ(read_error(R"({"type":"MovingFloat","values":[1],"interpolation":"None"})"),
              ErrorKind::Parse);
    EXPECT_EQ(read_error(R"({"type":"MovingFloat","values":[1],
        "datetimes":["2000-01-01T00:00:00+00"]})"), ErrorKind::Parse);
    EXPECT_EQ(read_error(R"({"type":"MovingFloat","values":[1,2],
        "datetimes":["2000-01-01T00:00:00+00","2000-01-02T00:00:00+00"],
        "upper_inc":true,"interpolation":"Linear"})"), ErrorKind::Parse);
}

TEST(MfJsonError, UnknownNames) {
    EXPECT_EQ(read_error(R"({"type":"MovingThing","values":[1],
        "datetimes":["2000-01-01T00:00:00+00"],"interpolation":"None"})"), ErrorKind::Parse);
    EXPECT_EQ(read_error(R"({"type":"MovingFloat","values":[1],
        "datetimes":["2000-01-01T00:00:00+00"],"interpolation":"Cubic"})"), ErrorKind::Parse);
}

TEST(MfJsonError, LengthMismatch) {
    EXPECT_EQ(read_error(R"({"type":"MovingFloat","values":[1,2],
        "datetimes":["2000-01-01T00:00:00+00"],
        "lower_inc":true,"upper_inc":true,"interpolation":"Linear"})"), ErrorKind::Parse);
}

TEST(MfJsonError, WrongValueKinds) {
    EXPECT_EQ(read_error(R"({"type":"MovingInteger","values":[1.5],
        "datetimes":["2000-01-01T00:00:00+00"],"interpolation":"None"})"), ErrorKind::Parse);
    EXPECT_EQ(read_error(R"({"type":"MovingPoint","coordinates":[[1]],
        "datetimes":["2000-01-01T00:00:00+00"],"interpolation":"None"})"), ErrorKind::Parse);
    EXPECT_EQ(read_error(R"({"type":"MovingFloat","values":[1],
        "datetimes":["yesterday"],"interpolation":"None"})"), ErrorKind::Parse);
    EXPECT_EQ(read_error(R"({"type":"MovingFloat","values":[1,2],
        "datetimes":["2000-01-01T00:00:00+00","2000-01-02T00:00:00+00"],
        "interpolation":"None"})"), ErrorKind::Parse);
}

TEST(MfJsonError, ConstructionErrorsPassThrough) {
    EXPECT_EQ(read_error(R"({"type":"MovingFloat","values":[1,2],
        "datetimes":["2000-01-02T00:00:00+00","2000-01-01T00:00:00+00"],
        "lower_inc":true,"upper_inc":true,"interpolation":"Linear"})"),
              ErrorKind::UnorderedInstants);
    EXPECT_EQ(read_error(R"({"type":"MovingText","values":["a","b"],
        "datetimes":["2000-01-01T00:00:00+00","2000-01-02T00:00:00+00"],
        "lower_inc":true,"upper_inc":true,"interpolation":"Linear"})"),
              ErrorKind::IncompatibleInterpolation);
}

TEST(MfJsonError, NestingDepthIsBounded) {
    const std::string deep = std::string(100, '[') + std::string(100, ']');
    auto r = temporal_from_mfjson(deep);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().kind, ErrorKind::Parse);

    const std::string shallow = std::string(10, '[') + std::string(10, ']');
    EXPECT_EQ(read_error(shallow), ErrorKind::Parse);
}
