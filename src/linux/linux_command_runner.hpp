#pragma once

#include "../interfaces/i_command_runner.hpp"

namespace quay {

// fork/execvp based runner. Output is read through pipes with poll() so a
// hung child (an ssh waiting on a dead link) is killed at the deadline.
class LinuxCommandRunner : public ICommandRunner {
public:
    LinuxCommandRunner() = default;
    ~LinuxCommandRunner() override = default;

    CommandResult run(const std::vector<std::string>& argv,
                      std::chrono::milliseconds timeout) override;
    SpawnResult spawn_detached(const std::vector<std::string>& argv) override;

private:
    static std::vector<char*> make_exec_args(const std::vector<std::string>& argv);
    static void redirect_to_dev_null(int fd, int flags);
    static bool read_available(int fd, std::string& buffer);
    static int read_exec_errno(int fd);
};

} // namespace quay
