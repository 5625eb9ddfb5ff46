#pragma once

#include "../port_entry.hpp"
#include "../errors.hpp"
#include <optional>
#include <string>
#include <vector>

namespace quay {

// One discovery source. collect() never throws and never fails the caller:
// on any command failure it returns an empty list and records an error.
class IPortCollector {
public:
    virtual ~IPortCollector() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    virtual std::vector<PortEntry> collect(const std::optional<std::string>& remote_host) = 0;

    virtual std::vector<SourceError> get_recent_errors() = 0;
    virtual void clear_errors() = 0;
};

struct ContainerIpResult {
    std::optional<std::string> ip;
    std::string error_message;
};

// Discovery inside a single named container.
class IContainerPortSource {
public:
    virtual ~IContainerPortSource() = default;

    virtual std::vector<PortEntry> collect_container(const std::string& container,
                                                     const std::optional<std::string>& remote_host) = 0;
    virtual ContainerIpResult get_container_ip(const std::string& container,
                                               const std::optional<std::string>& remote_host) = 0;
};

} // namespace quay
