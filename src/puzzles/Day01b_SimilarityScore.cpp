#include "advent/core/Puzzle.h"
#include "advent/core/PuzzleRegistry.h"
#include "advent/day01/LocationLists.h"

namespace advent {

class Day01b_SimilarityScore : public Puzzle {
public:
    std::string_view getID() const override { return "day01b"; }
    std::string_view getTitle() const override {
        return "Historian Hysteria: similarity score";
    }
    std::string_view getDefaultInput() const override { return "day01.txt"; }

    llvm::Expected<int64_t> solve(llvm::ArrayRef<std::string> lines,
                                  std::vector<Diagnostic> &diagnostics) const override {
        auto lists = parseLocationLists(lines, diagnostics);
        if (!lists)
            return lists.takeError();
        return similarityScore(*lists);
    }
};

ADVENT_REGISTER_PUZZLE(Day01b_SimilarityScore)

} // namespace advent
