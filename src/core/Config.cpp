#include "advent/core/Config.h"

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

LLVM_YAML_IS_STRING_MAP(std::string)

namespace llvm {
namespace yaml {

template <>
struct MappingTraits<advent::Config> {
    static void mapping(IO &io, advent::Config &cfg) {
        io.mapOptional("input_root",             cfg.inputRoot);
        io.mapOptional("format",                 cfg.format);
        io.mapOptional("output_file",            cfg.outputFile);
        io.mapOptional("report_malformed_lines", cfg.reportMalformedLines);
        io.mapOptional("inputs",                 cfg.inputs);
    }
};

} // namespace yaml
} // namespace llvm

namespace advent {

Config Config::defaults() {
    return Config{};
}

Config Config::loadFromString(llvm::StringRef text, llvm::StringRef origin) {
    Config cfg = defaults();
    llvm::yaml::Input yin(text);
    yin >> cfg;

    if (yin.error()) {
        llvm::errs() << "advent: warning: config parse error in '"
                     << origin << "', using defaults\n";
        return defaults();
    }

    return cfg;
}

Config Config::loadFromFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
    if (!bufOrErr) {
        llvm::errs() << "advent: warning: cannot open config '"
                     << path << "', using defaults\n";
        return defaults();
    }

    return loadFromString(bufOrErr.get()->getBuffer(), path);
}

} // namespace advent
