#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

#include "core/canonical.hpp"
#include "core/json_reader.hpp"

namespace {

using core::Format;
using core::Value;

std::string render(const Value& v, Format f = Format::Json, const core::CanonicalOptions& opts = {}) {
    std::string out;
    core::EngineError err;
    EXPECT_TRUE(core::canonicalize(v, f, out, err, opts)) << err.describe();
    return out;
}

Value json(const std::string& text) {
    Value v;
    std::string err;
    EXPECT_TRUE(core::parse_json(text, v, err)) << err;
    return v;
}

TEST(CanonicalTest, SingleKeyObject) {
    Value v;
    v.set("hello", Value::from_text("world"));
    EXPECT_EQ(render(v), "{\n  \"hello\": \"world\"\n}");
}

TEST(CanonicalTest, KeysSortedAndNestedIndentation) {
    const auto v = json(R"({"b": [1, {"z": null, "y": false}], "a": {}, "c": []})");
    EXPECT_EQ(render(v),
              "{\n"
              "  \"a\": {},\n"
              "  \"b\": [\n"
              "    1,\n"
              "    {\n"
              "      \"y\": false,\n"
              "      \"z\": null\n"
              "    }\n"
              "  ],\n"
              "  \"c\": []\n"
              "}");
}

TEST(CanonicalTest, KeyInsertionOrderDoesNotMatter) {
    const auto a = json(R"({"x": 1, "y": {"p": 1, "q": 2}, "z": 3})");
    const auto b = json(R"({"z": 3, "y": {"q": 2, "p": 1}, "x": 1})");
    EXPECT_NE(a, b);
    EXPECT_EQ(render(a), render(b));
}

TEST(CanonicalTest, SequencesKeepOrder) {
    EXPECT_EQ(render(json("[3, 1, 2]")), "[\n  3,\n  1,\n  2\n]");
}

TEST(CanonicalTest, RenderingIsDeterministic) {
    const auto v = json(R"({"k": [1.5, "s", null, {"b": 2, "a": 1}]})");
    EXPECT_EQ(render(v), render(v));
}

TEST(CanonicalTest, FloatFormatting) {
    EXPECT_EQ(core::format_float(1.0), "1.0");
    EXPECT_EQ(core::format_float(-0.0), "0.0");
    EXPECT_EQ(core::format_float(0.1), "0.1");
    EXPECT_EQ(core::format_float(100.0), "100.0");
    EXPECT_EQ(core::format_float(-2.5), "-2.5");
    EXPECT_EQ(core::format_float(1.0 / 3.0), "0.333333333333333");
    EXPECT_EQ(core::format_float(1e20), "1e+20");
    EXPECT_EQ(core::format_float(0.1 + 0.2), "0.3");
    EXPECT_FALSE(core::format_float(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_FALSE(core::format_float(std::numeric_limits<double>::infinity()));
}

TEST(CanonicalTest, IntegersRenderWithoutDecimalPoint) {
    EXPECT_EQ(render(Value::from_int(-42)), "-42");
    EXPECT_EQ(render(Value::from_float(42.0)), "42.0");
}

TEST(CanonicalTest, NonFiniteFloatIsMalformed) {
    Value v;
    v.set("x", Value::from_float(std::numeric_limits<double>::infinity()));
    std::string out = "untouched";
    core::EngineError err;
    EXPECT_FALSE(core::canonicalize(v, Format::Json, out, err));
    EXPECT_EQ(err.kind, core::ErrorKind::MalformedValue);
    EXPECT_NE(err.message.find("$.x"), std::string::npos) << err.message;
    EXPECT_EQ(out, "untouched");
}

TEST(CanonicalTest, DuplicateKeysAreMalformed) {
    core::Mapping m;
    m.push_back({"a", Value::from_int(1)});
    m.push_back({"a", Value::from_int(2)});
    std::string out;
    core::EngineError err;
    EXPECT_FALSE(core::canonicalize(Value::from_mapping(std::move(m)), Format::Json, out, err));
    EXPECT_EQ(err.kind, core::ErrorKind::MalformedValue);
}

TEST(CanonicalTest, StringEscaping) {
    EXPECT_EQ(core::quote_json_string("a\"b\\c\nd\te\x01"), "\"a\\\"b\\\\c\\nd\\te\\u0001\"");
    EXPECT_EQ(core::quote_json_string("caf\xc3\xa9/"), "\"caf\xc3\xa9/\"");
}

TEST(CanonicalTest, CsvFromMappingRecordsUsesSortedFirstRecordKeys) {
    const auto v = json(R"([{"name": "ann", "id": 1}, {"id": 2, "name": "bob, jr"}, {"id": 3}])");
    EXPECT_EQ(render(v, Format::Csv), "id,name\n1,ann\n2,\"bob, jr\"\n3,");
}

TEST(CanonicalTest, CsvExplicitSchemaOrdersColumns) {
    const auto v = json(R"([{"name": "ann", "id": 1}])");
    core::CanonicalOptions opts;
    opts.csv_columns = {"name", "id"};
    EXPECT_EQ(render(v, Format::Csv, opts), "name,id\nann,1");
}

TEST(CanonicalTest, CsvKeyOutsideSchemaIsMalformed) {
    const auto v = json(R"([{"id": 1}, {"id": 2, "extra": 3}])");
    std::string out;
    core::EngineError err;
    EXPECT_FALSE(core::canonicalize(v, Format::Csv, out, err));
    EXPECT_EQ(err.kind, core::ErrorKind::MalformedValue);
}

TEST(CanonicalTest, CsvFromRowsQuotesOnlyWhenNeeded) {
    const auto v = json(R"([["a", "b"], ["say \"hi\"", null], [1.5, true], ["line\nbreak", "plain"]])");
    EXPECT_EQ(render(v, Format::Csv), "a,b\n\"say \"\"hi\"\"\",\n1.5,true\n\"line\nbreak\",plain");
}

TEST(CanonicalTest, CsvRejectsNestedCellsAndMixedRecords) {
    std::string out;
    core::EngineError err;
    EXPECT_FALSE(core::canonicalize(json(R"([["a"], [[1]]])"), Format::Csv, out, err));
    EXPECT_EQ(err.kind, core::ErrorKind::MalformedValue);
    err.clear();
    EXPECT_FALSE(core::canonicalize(json(R"([{"a": 1}, ["x"]])"), Format::Csv, out, err));
    err.clear();
    EXPECT_FALSE(core::canonicalize(json(R"({"a": 1})"), Format::Csv, out, err));
}

TEST(CanonicalTest, TextFormatRendersScalarsVerbatim) {
    EXPECT_EQ(render(Value::from_text("line one\nline \"two\""), Format::Text), "line one\nline \"two\"");
    EXPECT_EQ(render(Value::from_int(7), Format::Text), "7");
    std::string out;
    core::EngineError err;
    EXPECT_FALSE(core::canonicalize(json("[1]"), Format::Text, out, err));
    EXPECT_EQ(err.kind, core::ErrorKind::MalformedValue);
}

TEST(CanonicalTest, BinaryKeepsBytesAndRejectsStructure) {
    const std::string bytes("\x89PNG\r\n\x00\xff", 8);
    std::string out;
    core::EngineError err;
    ASSERT_TRUE(core::canonicalize(Value::from_text(bytes), Format::Binary, out, err)) << err.describe();
    EXPECT_EQ(out, bytes);

    EXPECT_FALSE(core::canonicalize(Value::from_int(7), Format::Binary, out, err));
    EXPECT_EQ(err.kind, core::ErrorKind::MalformedValue);
}

TEST(CanonicalTest, FormatNamesRoundTrip) {
    for (auto f : {Format::Json, Format::Csv, Format::Text, Format::Binary}) {
        EXPECT_EQ(core::format_from_string(core::format_name(f)), f);
    }
    EXPECT_FALSE(core::format_from_string("yaml"));
}

} // namespace
