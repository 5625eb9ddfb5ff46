#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace quay {

// Where a listening port was discovered. Drives display and kill strategy.
enum class PortSource {
    Local,
    Ssh,
    Docker
};

struct PortEntry {
    PortSource source = PortSource::Local;
    uint16_t local_port = 0;                 // Never 0 once parsed

    // The logical "other end": SSH target, container name, forward destination
    std::optional<std::string> remote_host;
    std::optional<uint16_t> remote_port;

    std::string process_name;                // Best effort, empty if unknown
    std::optional<int> pid;                  // Absent for container-interior discovery

    // Docker only
    std::optional<std::string> container_id;
    std::optional<std::string> container_name;

    // SSH only: the tunnel destination, used to lock forward fields
    std::optional<std::string> ssh_host;

    bool is_open = false;
    bool is_loopback = false;                // Bound to 127.0.0.1 / [::1] inside a container

    bool operator==(const PortEntry&) const = default;
};

// Which host and container a session is looking at.
struct Target {
    std::optional<std::string> remote_host;
    std::optional<std::string> docker_target;

    [[nodiscard]] bool is_remote() const { return remote_host.has_value(); }
    [[nodiscard]] bool is_docker() const { return docker_target.has_value(); }
};

// "LOCAL", "SSH", "DOCKER"
std::string source_to_string(PortSource source);

// Tag used in the JSON export: "Local", "Ssh", "Docker"
std::string source_tag(PortSource source);

std::optional<PortSource> source_from_string(const std::string& text);

// "host:port", "host", or "-" when there is no remote end
std::string remote_display(const PortEntry& entry);

// Docker with an id: "container (id8)"; others: "name (pid:N)" or just the name
std::string process_display(const PortEntry& entry);

// Open entries first, then ascending local port. Stable.
void sort_entries(std::vector<PortEntry>& entries);

// Parses a decimal TCP port in 1..65535. Rejects signs, spaces and trailing text.
std::optional<uint16_t> parse_port(const std::string& text);

} // namespace quay
