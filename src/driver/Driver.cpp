#include "advent/driver/Driver.h"
#include "advent/core/RunMetadata.h"
#include "advent/core/Version.h"
#include "advent/input/PuzzleInput.h"

#include <llvm/Support/Error.h>
#include <llvm/Support/FileSystem.h>

#include <chrono>
#include <memory>
#include <utility>

namespace advent {

namespace {

void reportDiagnostics(const PuzzleResult &result, llvm::raw_ostream &err) {
    for (const auto &d : result.diagnostics) {
        err << "advent: " << severityToString(d.severity) << ": "
            << d.puzzleID << ":" << d.line << ": " << d.message
            << ": '" << d.lineText << "'\n";
    }
}

} // anonymous namespace

PuzzleResult runPuzzle(const Puzzle &puzzle, const Config &cfg,
                       llvm::StringRef inputFile) {
    PuzzleResult result;
    result.puzzleID = std::string(puzzle.getID());
    result.title = std::string(puzzle.getTitle());

    std::string root = cfg.inputRoot;
    std::string name(puzzle.getDefaultInput());
    if (!inputFile.empty()) {
        root.clear();
        name = inputFile.str();
    } else {
        auto it = cfg.inputs.find(result.puzzleID);
        if (it != cfg.inputs.end())
            name = it->second;
    }

    auto pathOrErr = resolveInputPath(root, name);
    if (!pathOrErr) {
        result.error = llvm::toString(pathOrErr.takeError());
        return result;
    }
    result.inputPath = *pathOrErr;

    auto linesOrErr = readLines(result.inputPath);
    if (!linesOrErr) {
        result.error = llvm::toString(linesOrErr.takeError());
        return result;
    }

    auto answerOrErr = puzzle.solve(*linesOrErr, result.diagnostics);
    for (auto &d : result.diagnostics)
        d.puzzleID = result.puzzleID;
    if (!answerOrErr) {
        result.error = llvm::toString(answerOrErr.takeError());
        return result;
    }

    result.solved = true;
    result.answer = *answerOrErr;
    return result;
}

int runDriver(const DriverOptions &opts, const PuzzleRegistry &registry,
              llvm::raw_ostream &out, llvm::raw_ostream &err) {
    if (opts.listPuzzles) {
        for (const Puzzle *p : registry.sortedByID())
            out << p->getID() << "\t" << p->getTitle()
                << " [" << p->getDefaultInput() << "]\n";
        return 0;
    }

    // Load config.
    Config cfg = opts.configPath.empty()
        ? Config::defaults()
        : Config::loadFromFile(opts.configPath);

    // CLI overrides.
    if (!opts.inputRoot.empty())
        cfg.inputRoot = opts.inputRoot;
    if (!opts.format.empty())
        cfg.format = opts.format;
    if (!opts.outputFile.empty())
        cfg.outputFile = opts.outputFile;
    if (opts.quiet)
        cfg.reportMalformedLines = false;

    if (cfg.format != "cli" && cfg.format != "json") {
        err << "advent: error: unknown output format '"
            << cfg.format << "' (expected cli or json)\n";
        return 2;
    }

    // Select puzzles.
    std::vector<const Puzzle *> selected;
    if (opts.puzzleIDs.empty()) {
        selected = registry.sortedByID();
    } else {
        for (const auto &id : opts.puzzleIDs) {
            const Puzzle *p = registry.findByID(id);
            if (!p) {
                err << "advent: error: unknown puzzle '" << id
                    << "' (see --list)\n";
                return 2;
            }
            selected.push_back(p);
        }
    }

    if (!opts.inputFile.empty() && selected.size() != 1) {
        err << "advent: error: --input requires exactly one puzzle\n";
        return 2;
    }

    RunMetadata meta;
    meta.toolVersion = kToolVersion;
    meta.configPath = opts.configPath;
    meta.inputRoot = cfg.inputRoot;
    meta.timestampEpochSec = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());

    // Solve.
    std::vector<PuzzleResult> results;
    unsigned failed = 0;
    for (const Puzzle *p : selected) {
        PuzzleResult result = runPuzzle(*p, cfg, opts.inputFile);

        if (!result.solved) {
            err << "advent: error: " << result.puzzleID << ": "
                << result.error << "\n";
            ++failed;
        }
        if (cfg.reportMalformedLines)
            reportDiagnostics(result, err);

        results.push_back(std::move(result));
    }

    // Format output.
    std::unique_ptr<OutputFormatter> formatter;
    if (cfg.format == "json")
        formatter = std::make_unique<JSONOutputFormatter>();
    else
        formatter = std::make_unique<CLIOutputFormatter>();

    std::string output = formatter->format(results, meta);

    // Emit.
    if (cfg.outputFile.empty()) {
        out << output;
    } else {
        std::error_code EC;
        llvm::raw_fd_ostream file(cfg.outputFile, EC, llvm::sys::fs::OF_Text);
        if (EC) {
            err << "advent: error: cannot open output file '"
                << cfg.outputFile << "': " << EC.message() << "\n";
            return 2;
        }
        file << output;
        file.close();
        if (file.has_error()) {
            err << "advent: error: cannot write output file '"
                << cfg.outputFile << "': " << file.error().message() << "\n";
            file.clear_error();
            return 2;
        }
    }

    return failed == 0 ? 0 : 1;
}

} // namespace advent
