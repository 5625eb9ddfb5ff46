#pragma once

#include <chrono>
#include <string>

namespace quay {

// Failure surfaced by a port collector (command missing, non-zero exit,
// transport failure). Collectors record these and return partial results.
struct SourceError {
    std::chrono::steady_clock::time_point timestamp;
    std::string source;
    std::string message;
};

} // namespace quay
