#include <gtest/gtest.h>

#include <string>

#include "core/json_reader.hpp"

namespace {

using core::Value;

TEST(JsonReaderTest, ObjectKeepsWrittenOrder) {
    Value v;
    std::string err;
    ASSERT_TRUE(core::parse_json(R"({"b": 1, "a": [true, null, "x"]})", v, err)) << err;
    ASSERT_TRUE(v.is_mapping());
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v.as_mapping()[0].key, "b");
    EXPECT_EQ(v.as_mapping()[1].key, "a");
    const auto& arr = v.find("a")->as_sequence();
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_TRUE(arr[0].as_bool());
    EXPECT_TRUE(arr[1].is_null());
    EXPECT_EQ(arr[2].as_text(), "x");
}

TEST(JsonReaderTest, NumbersKeepIntegerFloatDistinction) {
    Value v;
    std::string err;
    ASSERT_TRUE(core::parse_json("[1, -7, 1.0, 2e3, 9223372036854775807]", v, err)) << err;
    const auto& a = v.as_sequence();
    EXPECT_TRUE(a[0].is_int());
    EXPECT_EQ(a[1].as_int(), -7);
    EXPECT_TRUE(a[2].is_float());
    EXPECT_DOUBLE_EQ(a[3].as_float(), 2000.0);
    EXPECT_EQ(a[4].as_int(), 9223372036854775807LL);
}

TEST(JsonReaderTest, IntegerOutOfRangeIsAnError) {
    Value v;
    std::string err;
    EXPECT_FALSE(core::parse_json("99999999999999999999", v, err));
    EXPECT_NE(err.find("out of range"), std::string::npos) << err;
}

TEST(JsonReaderTest, UnicodeEscapesBecomeUtf8) {
    Value v;
    std::string err;
    ASSERT_TRUE(core::parse_json(R"(["\u00e9", "\ud83d\ude00", "a\nb"])", v, err)) << err;
    const auto& a = v.as_sequence();
    EXPECT_EQ(a[0].as_text(), "\xc3\xa9");
    EXPECT_EQ(a[1].as_text(), "\xf0\x9f\x98\x80");
    EXPECT_EQ(a[2].as_text(), "a\nb");
}

TEST(JsonReaderTest, RejectsMalformedInput) {
    Value v;
    std::string err;
    EXPECT_FALSE(core::parse_json("", v, err));
    EXPECT_FALSE(core::parse_json("{\"a\" 1}", v, err));
    EXPECT_FALSE(core::parse_json("[1,]", v, err));
    EXPECT_FALSE(core::parse_json("01", v, err));
    EXPECT_FALSE(core::parse_json("\"\\ud800\"", v, err));
    EXPECT_FALSE(core::parse_json("{} x", v, err));
    EXPECT_EQ(err, "Trailing characters after JSON value");
}

TEST(JsonReaderTest, DeepNestingIsRejectedNotOverflowed) {
    const std::string deep(100000, '[');
    Value v;
    std::string err;
    EXPECT_FALSE(core::parse_json(deep, v, err));
    EXPECT_NE(err.find("Nesting too deep"), std::string::npos) << err;
}

TEST(JsonReaderTest, FailureLeavesOutputUntouched) {
    Value v = Value::from_int(5);
    std::string err;
    EXPECT_FALSE(core::parse_json("[1, 2", v, err));
    EXPECT_EQ(v, Value::from_int(5));
}

} // namespace
