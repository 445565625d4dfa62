#pragma once

#include <cstdint>
#include <string>

namespace advent {

struct RunMetadata {
    std::string toolVersion;
    std::string configPath;
    std::string inputRoot;
    uint64_t timestampEpochSec = 0;
};

} // namespace advent
