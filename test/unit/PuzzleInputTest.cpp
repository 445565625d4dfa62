#include <gtest/gtest.h>

#include "advent/core/Error.h"
#include "advent/input/PuzzleInput.h"

#include <llvm/Support/Path.h>

using namespace advent;

TEST(PuzzleInputTest, SplitLines) {
    auto v = splitLines("a\nb\n");
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[0], "a");
    EXPECT_EQ(v[1], "b");
}

TEST(PuzzleInputTest, SplitLinesKeepsInteriorBlanksAndStripsCR) {
    auto v = splitLines("a\r\n\r\nb");
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[0], "a");
    EXPECT_EQ(v[1], "");
    EXPECT_EQ(v[2], "b");
}

TEST(PuzzleInputTest, SplitEmptyText) {
    EXPECT_TRUE(splitLines("").empty());
}

TEST(PuzzleInputTest, ResolveAndReadSample) {
    auto path = resolveInputPath(ADVENT_TEST_SAMPLES_DIR, "day01-sample.txt");
    ASSERT_TRUE(static_cast<bool>(path)) << llvm::toString(path.takeError());
    EXPECT_TRUE(llvm::sys::path::is_absolute(*path));
    EXPECT_EQ(llvm::sys::path::filename(*path), "day01-sample.txt");

    auto lines = readLines(*path);
    ASSERT_TRUE(static_cast<bool>(lines)) << llvm::toString(lines.takeError());
    ASSERT_EQ(lines->size(), 6u);
    EXPECT_EQ(lines->front(), "3   4");
    EXPECT_EQ(lines->back(), "3   3");
}

TEST(PuzzleInputTest, AbsoluteNameIgnoresRoot) {
    std::string absolute = std::string(ADVENT_TEST_SAMPLES_DIR) + "/day02-sample.txt";
    auto path = resolveInputPath("/nonexistent-root", absolute);
    ASSERT_TRUE(static_cast<bool>(path)) << llvm::toString(path.takeError());
    EXPECT_EQ(llvm::sys::path::filename(*path), "day02-sample.txt");
}

TEST(PuzzleInputTest, MissingFileIsInputError) {
    auto path = resolveInputPath(ADVENT_TEST_SAMPLES_DIR, "no-such-day.txt");
    ASSERT_FALSE(static_cast<bool>(path));
    llvm::Error err = path.takeError();
    EXPECT_TRUE(err.isA<InputError>());
    llvm::consumeError(std::move(err));

    auto lines = readLines(std::string(ADVENT_TEST_SAMPLES_DIR) + "/no-such-day.txt");
    ASSERT_FALSE(static_cast<bool>(lines));
    err = lines.takeError();
    EXPECT_TRUE(err.isA<InputError>());
    llvm::consumeError(std::move(err));
}
