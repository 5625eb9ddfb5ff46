#pragma once

#include "port_collector_base.hpp"

namespace quay {

// SSH tunnel clients found in the local process table (`ps aux`). Tunnels
// always run on this machine, so the remote host argument is ignored.
class SshPortCollector : public PortCollectorBase {
public:
    explicit SshPortCollector(ICommandRunner* runner);
    ~SshPortCollector() override = default;

    [[nodiscard]] std::string name() const override { return "ssh"; }
    std::vector<PortEntry> collect(const std::optional<std::string>& remote_host) override;

    // One entry per -L / -R mapping on every ssh line of `ps aux` output.
    static std::vector<PortEntry> parse_ssh_forwards(const std::string& ps_output);

    // Destination host of an ssh command line: the final token after the
    // ssh binary, provided it is neither a flag nor a forward spec. Any
    // other ordering is ambiguous and yields nullopt.
    static std::optional<std::string> extract_ssh_host(const std::string& line);
};

} // namespace quay
