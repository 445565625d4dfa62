#pragma once

namespace advent {

constexpr const char kToolVersion[] = "0.1.0";

} // namespace advent
