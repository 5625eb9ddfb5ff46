#include "ssh_forwarder.hpp"
#include "shell_command.hpp"
#include <spdlog/spdlog.h>

namespace quay {

SshForwarder::SshForwarder(ICommandRunner* runner)
    : runner_(runner)
{
}

ForwardResult SshForwarder::create_forward(const std::string& spec, const std::string& host, bool reverse) {
    ForwardResult result;
    if (trim(spec).empty() || trim(host).empty()) {
        result.error_message = "Forward needs a spec and a host";
        return result;
    }

    const std::vector<std::string> command = {"ssh", "-f", "-N", reverse ? "-R" : "-L", spec, host};
    SpawnResult spawn = runner_->spawn_detached(command);
    if (!spawn.success) {
        result.error_message = spawn.error_message;
        spdlog::warn("forward {} via {} failed: {}", spec, host, spawn.error_message);
        return result;
    }

    result.success = true;
    result.pid = spawn.pid;
    spdlog::info("forward {} {} via {} started (pid {})", reverse ? "-R" : "-L", spec, host, spawn.pid);
    return result;
}

} // namespace quay
