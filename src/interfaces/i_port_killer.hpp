#pragma once

#include "../port_entry.hpp"
#include <optional>
#include <string>

namespace quay {

struct KillResult {
    bool success = false;
    std::string error_message;
};

class IPortKiller {
public:
    virtual ~IPortKiller() = default;

    // Signals pid on the local host, or on remote_host when set.
    virtual KillResult kill_pid(int pid, const std::optional<std::string>& remote_host) = 0;

    // Stops a container by id (host-level Docker discovery).
    virtual KillResult stop_container(const std::string& container_id,
                                      const std::optional<std::string>& remote_host) = 0;

    // Signals pid inside a container (container-target discovery).
    virtual KillResult kill_in_container(const std::string& container, int pid,
                                         const std::optional<std::string>& remote_host) = 0;

    // Chooses the strategy from the entry's source and the session target.
    virtual KillResult kill_entry(const PortEntry& entry, const Target& target) = 0;
};

} // namespace quay
