#pragma once

#include <cstdint>
#include <string_view>

namespace advent {

enum class Severity : uint8_t {
    Note    = 0,
    Warning = 1,
    Error   = 2,
};

constexpr std::string_view severityToString(Severity s) {
    switch (s) {
        case Severity::Note:    return "note";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

} // namespace advent
