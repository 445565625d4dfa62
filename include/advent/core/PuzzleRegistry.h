#pragma once

#include "advent/core/Puzzle.h"

#include <memory>
#include <string_view>
#include <vector>

namespace advent {

class PuzzleRegistry {
public:
    static PuzzleRegistry &instance();

    void registerPuzzle(std::unique_ptr<Puzzle> puzzle);

    const std::vector<std::unique_ptr<Puzzle>> &puzzles() const { return puzzles_; }

    // Registration order follows static initialization; this is by ID.
    std::vector<const Puzzle *> sortedByID() const;

    const Puzzle *findByID(std::string_view id) const;

private:
    PuzzleRegistry() = default;
    std::vector<std::unique_ptr<Puzzle>> puzzles_;
};

// Macro for static self-registration in puzzle .cpp files.
#define ADVENT_REGISTER_PUZZLE(PuzzleClass)                                    \
    namespace {                                                                \
    struct PuzzleClass##Registrar {                                            \
        PuzzleClass##Registrar() {                                             \
            ::advent::PuzzleRegistry::instance().registerPuzzle(                \
                std::make_unique<PuzzleClass>());                              \
        }                                                                      \
    };                                                                         \
    static PuzzleClass##Registrar g_##PuzzleClass##Registrar;                  \
    } // anonymous namespace

} // namespace advent
