#pragma once

#include "advent/core/Config.h"
#include "advent/core/Puzzle.h"
#include "advent/core/PuzzleRegistry.h"
#include "advent/output/OutputFormatter.h"

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/raw_ostream.h>

#include <string>
#include <vector>

namespace advent {

// Command-line state after parsing; empty strings mean "not given".
struct DriverOptions {
    std::vector<std::string> puzzleIDs;  // empty = every registered puzzle
    std::string configPath;
    std::string inputFile;
    std::string inputRoot;
    std::string format;
    std::string outputFile;
    bool listPuzzles = false;
    bool quiet       = false;
};

// Resolve, read and solve one puzzle. Input precedence: `inputFile` (relative
// to the working directory), then cfg.inputs[id], then the puzzle's default
// input under cfg.inputRoot. Diagnostics come back stamped with the puzzle ID.
PuzzleResult runPuzzle(const Puzzle &puzzle, const Config &cfg,
                       llvm::StringRef inputFile);

// Exit codes: 0 all solved, 1 some puzzle failed, 2 usage/config/output error.
int runDriver(const DriverOptions &opts, const PuzzleRegistry &registry,
              llvm::raw_ostream &out, llvm::raw_ostream &err);

} // namespace advent
