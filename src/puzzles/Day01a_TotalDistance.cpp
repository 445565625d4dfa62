#include "advent/core/Puzzle.h"
#include "advent/core/PuzzleRegistry.h"
#include "advent/day01/LocationLists.h"

namespace advent {

class Day01a_TotalDistance : public Puzzle {
public:
    std::string_view getID() const override { return "day01a"; }
    std::string_view getTitle() const override {
        return "Historian Hysteria: total distance between lists";
    }
    std::string_view getDefaultInput() const override { return "day01.txt"; }

    llvm::Expected<int64_t> solve(llvm::ArrayRef<std::string> lines,
                                  std::vector<Diagnostic> &diagnostics) const override {
        auto lists = parseLocationLists(lines, diagnostics);
        if (!lists)
            return lists.takeError();
        return totalDistance(std::move(*lists));
    }
};

ADVENT_REGISTER_PUZZLE(Day01a_TotalDistance)

} // namespace advent
