#include "port_killer.hpp"
#include "shell_command.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace quay {

namespace {

constexpr std::chrono::milliseconds kKillTimeout{10000};

} // namespace

PortKiller::PortKiller(ICommandRunner* runner)
    : runner_(runner)
{
}

KillResult PortKiller::run_kill_command(const std::vector<std::string>& argv,
                                        const std::optional<std::string>& remote_host,
                                        const std::string& failure_prefix) {
    KillResult result;
    const auto command = with_remote(argv, remote_host);
    spdlog::info("kill: {}", shell_join(command));

    CommandResult run = runner_->run(command, kKillTimeout);
    if (!run.launched) {
        result.error_message = run.error_message;
    } else if (run.timed_out) {
        result.error_message = fmt::format("{}: timed out", failure_prefix);
    } else if (run.exit_code != 0) {
        const std::string detail = trim(run.err);
        result.error_message = detail.empty() ? failure_prefix : fmt::format("{}: {}", failure_prefix, detail);
    } else {
        result.success = true;
    }

    if (!result.success) {
        spdlog::warn("kill failed: {}", result.error_message);
    }
    return result;
}

KillResult PortKiller::kill_pid(int pid, const std::optional<std::string>& remote_host) {
    if (pid <= 0) {
        return {false, "Invalid PID"};
    }
    return run_kill_command({"kill", std::to_string(pid)}, remote_host,
                            fmt::format("Failed to kill process {}", pid));
}

KillResult PortKiller::stop_container(const std::string& container_id,
                                      const std::optional<std::string>& remote_host) {
    if (container_id.empty()) {
        return {false, "No container ID"};
    }
    return run_kill_command({"docker", "stop", container_id}, remote_host,
                            fmt::format("Failed to stop container {}", container_id));
}

KillResult PortKiller::kill_in_container(const std::string& container, int pid,
                                         const std::optional<std::string>& remote_host) {
    if (pid <= 0) {
        return {false, "Invalid PID"};
    }
    return run_kill_command({"docker", "exec", container, "kill", std::to_string(pid)}, remote_host,
                            fmt::format("Kill failed for PID {} in container", pid));
}

KillResult PortKiller::kill_entry(const PortEntry& entry, const Target& target) {
    if (target.docker_target) {
        if (!entry.pid) {
            return {false, kNoContainerPidMessage};
        }
        return kill_in_container(*target.docker_target, *entry.pid, target.remote_host);
    }

    switch (entry.source) {
        case PortSource::Ssh:
            // The tunnel client always runs here, even in remote mode
            if (!entry.pid) {
                return {false, fmt::format("No PID found for port {}", entry.local_port)};
            }
            return kill_pid(*entry.pid, std::nullopt);

        case PortSource::Local:
            if (!entry.pid) {
                return {false, fmt::format("No PID found for port {}", entry.local_port)};
            }
            return kill_pid(*entry.pid, target.remote_host);

        case PortSource::Docker:
            if (!entry.container_id) {
                return {false, fmt::format("No container ID found for port {}", entry.local_port)};
            }
            return stop_container(*entry.container_id, target.remote_host);
    }

    return {false, "Unknown port source"};
}

} // namespace quay
