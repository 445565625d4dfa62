#include "advent/core/PuzzleRegistry.h"

#include <algorithm>

namespace advent {

PuzzleRegistry &PuzzleRegistry::instance() {
    static PuzzleRegistry registry;
    return registry;
}

void PuzzleRegistry::registerPuzzle(std::unique_ptr<Puzzle> puzzle) {
    puzzles_.push_back(std::move(puzzle));
}

std::vector<const Puzzle *> PuzzleRegistry::sortedByID() const {
    std::vector<const Puzzle *> out;
    out.reserve(puzzles_.size());
    for (const auto &p : puzzles_)
        out.push_back(p.get());

    std::sort(out.begin(), out.end(),
              [](const Puzzle *a, const Puzzle *b) { return a->getID() < b->getID(); });
    return out;
}

const Puzzle *PuzzleRegistry::findByID(std::string_view id) const {
    auto it = std::find_if(puzzles_.begin(), puzzles_.end(),
                           [id](const auto &p) { return p->getID() == id; });
    return (it != puzzles_.end()) ? it->get() : nullptr;
}

} // namespace advent
