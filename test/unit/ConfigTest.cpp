#include <gtest/gtest.h>

#include "advent/core/Config.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/raw_ostream.h>

using namespace advent;

TEST(ConfigTest, Defaults) {
    Config cfg = Config::defaults();
    EXPECT_EQ(cfg.inputRoot, "puzzle-inputs");
    EXPECT_EQ(cfg.format, "cli");
    EXPECT_TRUE(cfg.outputFile.empty());
    EXPECT_TRUE(cfg.reportMalformedLines);
    EXPECT_TRUE(cfg.inputs.empty());
}

TEST(ConfigTest, ParsesAllKeys) {
    Config cfg = Config::loadFromString(
        "input_root: test/samples\n"
        "format: json\n"
        "output_file: answers.json\n"
        "report_malformed_lines: false\n"
        "inputs:\n"
        "  day01a: day01-sample.txt\n"
        "  day02b: day02-sample.txt\n",
        "inline");

    EXPECT_EQ(cfg.inputRoot, "test/samples");
    EXPECT_EQ(cfg.format, "json");
    EXPECT_EQ(cfg.outputFile, "answers.json");
    EXPECT_FALSE(cfg.reportMalformedLines);
    ASSERT_EQ(cfg.inputs.size(), 2u);
    EXPECT_EQ(cfg.inputs["day01a"], "day01-sample.txt");
    EXPECT_EQ(cfg.inputs["day02b"], "day02-sample.txt");
}

TEST(ConfigTest, PartialConfigKeepsDefaults) {
    Config cfg = Config::loadFromString("format: json\n", "inline");
    EXPECT_EQ(cfg.format, "json");
    EXPECT_EQ(cfg.inputRoot, "puzzle-inputs");
    EXPECT_TRUE(cfg.reportMalformedLines);
}

TEST(ConfigTest, ParseErrorFallsBackToDefaults) {
    Config cfg = Config::loadFromString("report_malformed_lines: [1, 2\n", "inline");
    EXPECT_EQ(cfg.format, "cli");
    EXPECT_TRUE(cfg.reportMalformedLines);
}

TEST(ConfigTest, MissingFileFallsBackToDefaults) {
    Config cfg = Config::loadFromFile("/nonexistent/advent.config.yaml");
    EXPECT_EQ(cfg.inputRoot, "puzzle-inputs");
}

TEST(ConfigTest, LoadsFromFile) {
    llvm::SmallString<128> path;
    ASSERT_FALSE(llvm::sys::fs::createTemporaryFile("advent-config", "yaml", path));
    {
        std::error_code EC;
        llvm::raw_fd_ostream os(path, EC, llvm::sys::fs::OF_Text);
        ASSERT_FALSE(EC) << EC.message();
        os << "input_root: /tmp/inputs\n";
    }

    Config cfg = Config::loadFromFile(std::string(path));
    EXPECT_EQ(cfg.inputRoot, "/tmp/inputs");

    llvm::sys::fs::remove(path);
}
