#include "advent/core/PuzzleRegistry.h"
#include "advent/driver/Driver.h"

#include <llvm/Support/CommandLine.h>
#include <llvm/Support/raw_ostream.h>

#include <string>

static llvm::cl::OptionCategory AdventCat("advent options");

static llvm::cl::list<std::string> PuzzleIDs(
    llvm::cl::Positional,
    llvm::cl::desc("[<puzzle>...]"),
    llvm::cl::ZeroOrMore,
    llvm::cl::cat(AdventCat));

static llvm::cl::opt<std::string> ConfigPath(
    "config",
    llvm::cl::desc("Path to advent.config.yaml"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(AdventCat));

static llvm::cl::opt<std::string> InputFile(
    "input",
    llvm::cl::desc("Explicit input file (requires exactly one puzzle)"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(AdventCat));

static llvm::cl::opt<std::string> InputRoot(
    "input-root",
    llvm::cl::desc("Directory that default puzzle inputs are resolved against"),
    llvm::cl::value_desc("dir"),
    llvm::cl::cat(AdventCat));

static llvm::cl::opt<std::string> OutputFormat(
    "format",
    llvm::cl::desc("Output format (cli|json)"),
    llvm::cl::cat(AdventCat));

static llvm::cl::opt<std::string> OutputFile(
    "output",
    llvm::cl::desc("Write output to file instead of stdout"),
    llvm::cl::value_desc("file"),
    llvm::cl::cat(AdventCat));

static llvm::cl::opt<bool> ListPuzzles(
    "list",
    llvm::cl::desc("List registered puzzles and exit"),
    llvm::cl::cat(AdventCat));

static llvm::cl::opt<bool> Quiet(
    "quiet",
    llvm::cl::desc("Do not echo diagnostics to stderr"),
    llvm::cl::cat(AdventCat));

int main(int argc, const char **argv) {
    llvm::cl::HideUnrelatedOptions(AdventCat);
    if (!llvm::cl::ParseCommandLineOptions(argc, argv, "advent puzzle solver\n",
                                           &llvm::errs()))
        return 2;

    advent::DriverOptions opts;
    opts.puzzleIDs.assign(PuzzleIDs.begin(), PuzzleIDs.end());
    opts.configPath = ConfigPath.getValue();
    opts.inputFile = InputFile.getValue();
    opts.inputRoot = InputRoot.getValue();
    opts.format = OutputFormat.getValue();
    opts.outputFile = OutputFile.getValue();
    opts.listPuzzles = ListPuzzles;
    opts.quiet = Quiet;

    return advent::runDriver(opts, advent::PuzzleRegistry::instance(),
                             llvm::outs(), llvm::errs());
}
