#pragma once

#include "port_collector_base.hpp"

namespace quay {

// Two discovery modes:
//  - host level: published ports from `docker ps`
//  - container interior: listening sockets from `docker exec <c> ss -tln`
// plus the container's private IP from `docker inspect`.
class DockerPortCollector : public PortCollectorBase, public IContainerPortSource {
public:
    explicit DockerPortCollector(ICommandRunner* runner);
    ~DockerPortCollector() override = default;

    [[nodiscard]] std::string name() const override { return "docker"; }
    std::vector<PortEntry> collect(const std::optional<std::string>& remote_host) override;

    std::vector<PortEntry> collect_container(const std::string& container,
                                             const std::optional<std::string>& remote_host) override;
    ContainerIpResult get_container_ip(const std::string& container,
                                       const std::optional<std::string>& remote_host) override;

    // Tab separated id / name / ports lines. Ranges expand pairwise; IPv4 and
    // IPv6 publications of the same port collapse per container line.
    static std::vector<PortEntry> parse_docker_ps(const std::string& output, bool remote_mode);

    // `ss -tln` table rows in LISTEN state. Entries are always open.
    static std::vector<PortEntry> parse_ss_output(const std::string& output, const std::string& container);

    static constexpr const char* kPsFormat = "{{.ID}}\\t{{.Names}}\\t{{.Ports}}";
    static constexpr const char* kInspectFormat = "{{range .NetworkSettings.Networks}}{{.IPAddress}}{{end}}";
};

} // namespace quay
