#pragma once

#include "interfaces/i_port_killer.hpp"
#include "interfaces/i_command_runner.hpp"

namespace quay {

// Issues kill / docker stop / docker exec kill through the command runner,
// over ssh when a remote host is given.
class PortKiller : public IPortKiller {
public:
    explicit PortKiller(ICommandRunner* runner);
    ~PortKiller() override = default;

    KillResult kill_pid(int pid, const std::optional<std::string>& remote_host) override;
    KillResult stop_container(const std::string& container_id,
                              const std::optional<std::string>& remote_host) override;
    KillResult kill_in_container(const std::string& container, int pid,
                                 const std::optional<std::string>& remote_host) override;
    KillResult kill_entry(const PortEntry& entry, const Target& target) override;

    static constexpr const char* kNoContainerPidMessage =
        "No PID available for this port (container ss doesn't report PIDs)";

private:
    KillResult run_kill_command(const std::vector<std::string>& argv,
                                const std::optional<std::string>& remote_host,
                                const std::string& failure_prefix);

    ICommandRunner* runner_ = nullptr;
};

} // namespace quay
