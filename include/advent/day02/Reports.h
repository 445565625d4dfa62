#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/Support/Error.h>

#include <cstdint>
#include <string>
#include <vector>

namespace advent {

using Report = std::vector<int64_t>;

// One report per non-blank line, levels split on runs of whitespace.
// A level that is not an integer fails with ParseError.
llvm::Expected<std::vector<Report>> parseReports(llvm::ArrayRef<std::string> lines);

// Levels are strictly increasing or strictly decreasing, and adjacent levels
// differ by at least 1 and at most 3.
bool isSafe(llvm::ArrayRef<int64_t> levels);

// isSafe(), or safe once any single level is removed.
bool isSafeWithDampener(llvm::ArrayRef<int64_t> levels);

} // namespace advent
