#include <gtest/gtest.h>

#include "util/byte_size.hpp"

TEST(ByteSizeTest, FormatsDecimalUnits) {
    EXPECT_EQ(treecopy::FormatByteSize(0), "0 B");
    EXPECT_EQ(treecopy::FormatByteSize(15), "15 B");
    EXPECT_EQ(treecopy::FormatByteSize(999), "999 B");
    EXPECT_EQ(treecopy::FormatByteSize(1000), "1.0 KB");
    EXPECT_EQ(treecopy::FormatByteSize(1500), "1.5 KB");
    EXPECT_EQ(treecopy::FormatByteSize(2000000), "2.0 MB");
    EXPECT_EQ(treecopy::FormatByteSize(3500000000ULL), "3.5 GB");
}

TEST(ByteSizeTest, ParsesCountsWithBinarySuffixes) {
    EXPECT_EQ(treecopy::ParseByteCount("65536").value(), 65536u);
    EXPECT_EQ(treecopy::ParseByteCount("64K").value(), 64u * 1024u);
    EXPECT_EQ(treecopy::ParseByteCount("64kib").value(), 64u * 1024u);
    EXPECT_EQ(treecopy::ParseByteCount("1M").value(), 1024u * 1024u);
    EXPECT_EQ(treecopy::ParseByteCount("2G").value(), 2ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(treecopy::ParseByteCount("12b").value(), 12u);
}

TEST(ByteSizeTest, RejectsMalformedCounts) {
    EXPECT_FALSE(treecopy::ParseByteCount("").has_value());
    EXPECT_FALSE(treecopy::ParseByteCount("K").has_value());
    EXPECT_FALSE(treecopy::ParseByteCount("12XB").has_value());
    EXPECT_FALSE(treecopy::ParseByteCount("-5").has_value());
    EXPECT_FALSE(treecopy::ParseByteCount("99999999999999999999").has_value());
    EXPECT_FALSE(treecopy::ParseByteCount("99999999999999G").has_value());
}
