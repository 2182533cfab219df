#include "store/record.hpp"

#include <gtest/gtest.h>

using namespace squirrel::store;

TEST(RecordIdTest, ParsesPositiveDecimal) {
    EXPECT_EQ(parse_record_id("1").value_or(0), RecordId{1});
    EXPECT_EQ(parse_record_id("42").value_or(0), RecordId{42});
    EXPECT_EQ(parse_record_id("007").value_or(0), RecordId{7});
    EXPECT_EQ(parse_record_id("9223372036854775807").value_or(0), RecordId{9223372036854775807LL});
}

TEST(RecordIdTest, RejectsNonNumeric) {
    EXPECT_FALSE(parse_record_id("").has_value());
    EXPECT_FALSE(parse_record_id("abc").has_value());
    EXPECT_FALSE(parse_record_id("12abc").has_value());
    EXPECT_FALSE(parse_record_id(" 12").has_value());
    EXPECT_FALSE(parse_record_id("+12").has_value());
    EXPECT_FALSE(parse_record_id("-3").has_value());
    EXPECT_FALSE(parse_record_id("0x10").has_value());
    EXPECT_FALSE(parse_record_id("1.5").has_value());
}

TEST(RecordIdTest, RejectsZeroAndOverflow) {
    EXPECT_FALSE(parse_record_id("0").has_value());
    EXPECT_FALSE(parse_record_id("000").has_value());
    EXPECT_FALSE(parse_record_id("9223372036854775808").has_value());
    EXPECT_FALSE(parse_record_id("99999999999999999999999").has_value());
}

TEST(RecordTest, Equality) {
    Record a{1, "Chip", "small"};
    Record b{1, "Chip", "small"};
    Record c{1, "Chip", "large"};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
