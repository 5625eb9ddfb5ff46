#pragma once

#include "port_entry.hpp"
#include <vector>

namespace quay {

// Fixed demo set for --mock: every source, open and closed entries, unique
// ports. Already sorted.
std::vector<PortEntry> make_mock_entries();

// The entry a mock forward adds in place of spawning ssh
PortEntry make_mock_forward_entry(uint16_t local_port, const std::string& remote_host,
                                  std::optional<uint16_t> remote_port, const std::string& ssh_host);

constexpr int kMockForwardPid = 99999;

} // namespace quay
