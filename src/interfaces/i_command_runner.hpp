#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace quay {

struct CommandResult {
    bool launched = false;      // false if the binary could not be started
    bool timed_out = false;     // child was killed after the deadline
    int exit_code = -1;
    std::string out;
    std::string err;
    std::string error_message;  // Set when launched is false

    [[nodiscard]] bool ok() const { return launched && !timed_out && exit_code == 0; }
};

struct SpawnResult {
    bool success = false;
    int pid = -1;
    std::string error_message;
};

class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    // Runs argv[0] with the given arguments, capturing stdout and stderr.
    // Blocks until the child exits or the timeout elapses.
    virtual CommandResult run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout) = 0;

    // Starts argv[0] in the background and returns its pid without waiting.
    virtual SpawnResult spawn_detached(const std::vector<std::string>& argv) = 0;
};

} // namespace quay
