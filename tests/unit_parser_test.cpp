#include <gtest/gtest.h>

#include "dockhand/core/errors.hpp"
#include "dockhand/parsers/unit_parser.hpp"

#include <string>
#include <utility>
#include <vector>

using namespace dockhand;

TEST(UnitParserTest, MultiplierTable) {
    EXPECT_DOUBLE_EQ(parsers::UnitMultiplier("B"), 1.0);
    EXPECT_DOUBLE_EQ(parsers::UnitMultiplier("KB"), 1e3);
    EXPECT_DOUBLE_EQ(parsers::UnitMultiplier("kB"), 1e3);
    EXPECT_DOUBLE_EQ(parsers::UnitMultiplier("MB"), 1e6);
    EXPECT_DOUBLE_EQ(parsers::UnitMultiplier("GB"), 1e9);
    EXPECT_DOUBLE_EQ(parsers::UnitMultiplier("TB"), 1e12);
    EXPECT_DOUBLE_EQ(parsers::UnitMultiplier("KiB"), 1024.0);
    EXPECT_DOUBLE_EQ(parsers::UnitMultiplier("MiB"), 1048576.0);
    EXPECT_DOUBLE_EQ(parsers::UnitMultiplier("GiB"), 1073741824.0);
    EXPECT_DOUBLE_EQ(parsers::UnitMultiplier("TiB"), 1099511627776.0);
}

TEST(UnitParserTest, EveryUnitScalesItsValue) {
    const std::vector<std::string> units = {"B", "KB", "MB", "GB", "TB",
                                            "KiB", "MiB", "GiB", "TiB"};
    for (const auto& unit : units) {
        SCOPED_TRACE(unit);
        EXPECT_DOUBLE_EQ(parsers::ParseByteSize("2.5" + unit),
                         2.5 * parsers::UnitMultiplier(unit));
    }
}

TEST(UnitParserTest, BinarySuffixIsNotReadAsBytes) {
    EXPECT_DOUBLE_EQ(parsers::ParseByteSize("3KiB"), 3072.0);
    EXPECT_DOUBLE_EQ(parsers::ParseByteSize("1MiB"), 1048576.0);
}

TEST(UnitParserTest, BareNumberHasMultiplierOne) {
    EXPECT_DOUBLE_EQ(parsers::ParseByteSize("512"), 512.0);
    EXPECT_DOUBLE_EQ(parsers::ParseByteSize(" 0 "), 0.0);
}

TEST(UnitParserTest, ParsesDockerIoPair) {
    auto io = parsers::ParseIoStats("12.3MB / 1.2GiB");
    EXPECT_NEAR(io.in, 12300000.0, 1e-3);
    EXPECT_NEAR(io.out, 1288490188.8, 1e-3);
}

TEST(UnitParserTest, ParsesLowercaseKilobytes) {
    auto io = parsers::ParseIoStats("1.5kB / 0B");
    EXPECT_DOUBLE_EQ(io.in, 1500.0);
    EXPECT_DOUBLE_EQ(io.out, 0.0);
}

TEST(UnitParserTest, RejectsMissingSeparator) {
    EXPECT_THROW(parsers::ParseIoStats("12MB"), core::ParseError);
    EXPECT_THROW(parsers::ParseIoStats("1B / 2B / 3B"), core::ParseError);
    EXPECT_THROW(parsers::ParseIoStats(""), core::ParseError);
}

TEST(UnitParserTest, RejectsGarbageNumbers) {
    EXPECT_THROW(parsers::ParseIoStats("abcMB / 1MB"), core::ParseError);
    EXPECT_THROW(parsers::ParseIoStats("1MB / 1.2.3GB"), core::ParseError);
    EXPECT_THROW(parsers::ParseByteSize("MB"), core::ParseError);
    EXPECT_THROW(parsers::ParseByteSize("--"), core::ParseError);
}
