#pragma once

#include "../interfaces/i_port_prober.hpp"
#include <chrono>

namespace quay {

// Probes 127.0.0.1:<port> with a non-blocking connect, one thread per port.
class LinuxPortProber : public IPortProber {
public:
    explicit LinuxPortProber(std::chrono::milliseconds timeout = std::chrono::milliseconds(200));
    ~LinuxPortProber() override = default;

    std::map<uint16_t, bool> probe(const std::vector<uint16_t>& ports) override;

    // Single blocking probe, bounded by timeout.
    static bool is_port_open(uint16_t port, std::chrono::milliseconds timeout);

private:
    std::chrono::milliseconds timeout_;
};

} // namespace quay
