#pragma once

#include "port_collector_base.hpp"

namespace quay {

// Listening TCP sockets from `lsof -i -P -n -sTCP:LISTEN -Fcpn`, run locally
// or on a remote host over ssh.
class LocalPortCollector : public PortCollectorBase {
public:
    explicit LocalPortCollector(ICommandRunner* runner);
    ~LocalPortCollector() override = default;

    [[nodiscard]] std::string name() const override { return "local"; }
    std::vector<PortEntry> collect(const std::optional<std::string>& remote_host) override;

    // Parses lsof field output (p<pid>, c<command>, n<address> lines).
    // Remote listings are trusted as open. One entry per port, first wins.
    static std::vector<PortEntry> parse_lsof_fields(const std::string& output, bool remote_mode);

    // Trailing segment after the last ':' ("*:80", "127.0.0.1:80", "[::1]:80")
    static std::optional<uint16_t> extract_port(const std::string& address);
};

} // namespace quay
