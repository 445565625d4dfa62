#include <gtest/gtest.h>

#include "advent/core/Error.h"
#include "advent/day02/Reports.h"

#include <cstdint>

using namespace advent;

TEST(ReportsTest, ParsesWhitespaceSeparatedLevels) {
    std::vector<std::string> lines = {"7 6 4 2 1", "", "  1\t2  7 8 9 "};
    auto reports = parseReports(lines);
    ASSERT_TRUE(static_cast<bool>(reports)) << llvm::toString(reports.takeError());

    ASSERT_EQ(reports->size(), 2u);
    EXPECT_EQ((*reports)[0], (Report{7, 6, 4, 2, 1}));
    EXPECT_EQ((*reports)[1], (Report{1, 2, 7, 8, 9}));
}

TEST(ReportsTest, NonNumericLevelIsParseError) {
    std::vector<std::string> lines = {"1 2 3", "4 five 6"};
    auto reports = parseReports(lines);
    ASSERT_FALSE(static_cast<bool>(reports));

    llvm::Error err = reports.takeError();
    ASSERT_TRUE(err.isA<ParseError>());
    llvm::handleAllErrors(std::move(err), [](const ParseError &E) {
        EXPECT_EQ(E.line(), 2u);
        EXPECT_EQ(E.field(), "five");
    });
}

TEST(ReportsTest, SafetyRules) {
    EXPECT_TRUE(isSafe(Report{7, 6, 4, 2, 1}));
    EXPECT_FALSE(isSafe(Report{1, 2, 7, 8, 9}));   // jump of 5
    EXPECT_FALSE(isSafe(Report{9, 7, 6, 2, 1}));   // drop of 4
    EXPECT_FALSE(isSafe(Report{1, 3, 2, 4, 5}));   // changes direction
    EXPECT_FALSE(isSafe(Report{8, 6, 4, 4, 1}));   // flat step
    EXPECT_TRUE(isSafe(Report{1, 3, 6, 7, 9}));
}

TEST(ReportsTest, ShortReportsAreSafe) {
    EXPECT_TRUE(isSafe(Report{}));
    EXPECT_TRUE(isSafe(Report{42}));
}

TEST(ReportsTest, DampenerToleratesOneBadLevel) {
    EXPECT_TRUE(isSafeWithDampener(Report{1, 3, 2, 4, 5}));
    EXPECT_TRUE(isSafeWithDampener(Report{8, 6, 4, 4, 1}));
    EXPECT_TRUE(isSafeWithDampener(Report{10, 1, 2, 3}));  // first level removed
    EXPECT_FALSE(isSafeWithDampener(Report{1, 2, 7, 8, 9}));
    EXPECT_FALSE(isSafeWithDampener(Report{9, 7, 6, 2, 1}));
}

TEST(ReportsTest, ExtremeLevelsAreUnsafeWithoutOverflow) {
    std::vector<std::string> lines = {"-9223372036854775808 9223372036854775807"};
    auto reports = parseReports(lines);
    ASSERT_TRUE(static_cast<bool>(reports)) << llvm::toString(reports.takeError());
    ASSERT_EQ(reports->size(), 1u);

    EXPECT_FALSE(isSafe((*reports)[0]));
    EXPECT_FALSE(isSafe(Report{INT64_MAX, INT64_MIN}));
    EXPECT_FALSE(isSafeWithDampener(Report{INT64_MIN, INT64_MAX, 0}));
    EXPECT_TRUE(isSafe(Report{INT64_MAX - 2, INT64_MAX}));
}
