#pragma once

#include "advent/core/Diagnostic.h"
#include "advent/core/RunMetadata.h"

#include <cstdint>
#include <string>
#include <vector>

namespace advent {

struct PuzzleResult {
    std::string puzzleID;
    std::string title;
    std::string inputPath;
    bool        solved = false;
    int64_t     answer = 0;
    std::string error;  // set when !solved
    std::vector<Diagnostic> diagnostics;
};

class OutputFormatter {
public:
    virtual ~OutputFormatter() = default;
    virtual std::string format(const std::vector<PuzzleResult> &results) = 0;
    virtual std::string format(const std::vector<PuzzleResult> &results,
                               const RunMetadata &meta) {
        return format(results);
    }
};

class CLIOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<PuzzleResult> &results) override;
};

class JSONOutputFormatter : public OutputFormatter {
public:
    std::string format(const std::vector<PuzzleResult> &results) override;
    std::string format(const std::vector<PuzzleResult> &results,
                       const RunMetadata &meta) override;
};

} // namespace advent
