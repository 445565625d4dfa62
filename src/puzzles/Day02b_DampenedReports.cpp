#include "advent/core/Puzzle.h"
#include "advent/core/PuzzleRegistry.h"
#include "advent/day02/Reports.h"

#include <algorithm>

namespace advent {

class Day02b_DampenedReports : public Puzzle {
public:
    std::string_view getID() const override { return "day02b"; }
    std::string_view getTitle() const override {
        return "Red-Nosed Reports: safe reports with problem dampener";
    }
    std::string_view getDefaultInput() const override { return "day02.txt"; }

    llvm::Expected<int64_t> solve(llvm::ArrayRef<std::string> lines,
                                  std::vector<Diagnostic> &) const override {
        auto reports = parseReports(lines);
        if (!reports)
            return reports.takeError();
        return static_cast<int64_t>(
            std::count_if(reports->begin(), reports->end(),
                          [](const Report &r) { return isSafeWithDampener(r); }));
    }
};

ADVENT_REGISTER_PUZZLE(Day02b_DampenedReports)

} // namespace advent
