#include <gtest/gtest.h>

#include <string>

#include "core/csv_reader.hpp"

namespace {

using core::Value;

TEST(CsvReaderTest, HeaderStaysTextAndCellsAreInferred) {
    Value v;
    std::string err;
    ASSERT_TRUE(core::parse_csv("id,score,ok,name\n1,2.5,true,ann\n", v, err)) << err;
    const auto& rows = v.as_sequence();
    ASSERT_EQ(rows.size(), 2u);
    const auto& header = rows[0].as_sequence();
    EXPECT_EQ(header[0].as_text(), "id");
    const auto& r = rows[1].as_sequence();
    EXPECT_EQ(r[0], Value::from_int(1));
    EXPECT_EQ(r[1], Value::from_float(2.5));
    EXPECT_EQ(r[2], Value::from_bool(true));
    EXPECT_EQ(r[3], Value::from_text("ann"));
}

TEST(CsvReaderTest, QuotedFieldsWithDelimitersQuotesAndNewlines) {
    Value v;
    std::string err;
    ASSERT_TRUE(core::parse_csv("a,b\r\n\"x,y\",\"he said \"\"hi\"\"\nbye\"\r\n", v, err)) << err;
    const auto& r = v.as_sequence()[1].as_sequence();
    EXPECT_EQ(r[0].as_text(), "x,y");
    EXPECT_EQ(r[1].as_text(), "he said \"hi\"\nbye");
}

TEST(CsvReaderTest, FinalLineWithoutNewlineCounts) {
    Value v;
    std::string err;
    ASSERT_TRUE(core::parse_csv("a\n1", v, err)) << err;
    EXPECT_EQ(v.size(), 2u);
}

TEST(CsvReaderTest, RowWidthMustMatchHeader) {
    Value v;
    std::string err;
    EXPECT_FALSE(core::parse_csv("a,b\n1\n", v, err));
    EXPECT_NE(err.find("Row 2"), std::string::npos) << err;
}

TEST(CsvReaderTest, RejectsStrayQuotesAndEmptyInput) {
    Value v;
    std::string err;
    EXPECT_FALSE(core::parse_csv("a\nx\"y\n", v, err));
    EXPECT_FALSE(core::parse_csv("a\n\"open\n", v, err));
    EXPECT_FALSE(core::parse_csv("", v, err));
}

TEST(CsvReaderTest, InferCell) {
    EXPECT_EQ(core::infer_cell(""), Value::from_text(""));
    EXPECT_EQ(core::infer_cell("-12"), Value::from_int(-12));
    EXPECT_EQ(core::infer_cell("+3"), Value::from_int(3));
    EXPECT_EQ(core::infer_cell("1e3"), Value::from_float(1000.0));
    EXPECT_EQ(core::infer_cell("false"), Value::from_bool(false));
    EXPECT_EQ(core::infer_cell("12abc"), Value::from_text("12abc"));
    EXPECT_EQ(core::infer_cell("99999999999999999999"), Value::from_text("99999999999999999999"));
}

} // namespace
