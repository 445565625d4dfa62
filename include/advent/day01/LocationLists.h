#pragma once

#include "advent/core/Diagnostic.h"

#include <llvm/ADT/ArrayRef.h>
#include <llvm/Support/Error.h>

#include <cstdint>
#include <string>
#include <vector>

namespace advent {

// The two columns of a day 1 input, in input order until sorted.
struct LocationLists {
    std::vector<int64_t> left;
    std::vector<int64_t> right;
};

// Extract "<digits> <whitespace> <digits>" pairs from `lines`.
//
// Lines are trimmed first. Blank lines are ignored. Any other line that does
// not match gets a Warning diagnostic and is skipped. A matched field that
// does not fit in int64_t fails with ParseError.
llvm::Expected<LocationLists> parseLocationLists(llvm::ArrayRef<std::string> lines,
                                                 std::vector<Diagnostic> &diagnostics);

// Sort both lists ascending, pair them by position and sum the absolute
// differences. Lists of unequal length fail with LengthMismatchError, a sum
// beyond int64_t with OverflowError.
llvm::Expected<int64_t> totalDistance(LocationLists lists);

// Sum of each left value times the number of times it occurs in the right
// list. Fails with OverflowError if the score does not fit in int64_t.
llvm::Expected<int64_t> similarityScore(const LocationLists &lists);

} // namespace advent
