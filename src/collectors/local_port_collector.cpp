#include "local_port_collector.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <sstream>

namespace quay {

LocalPortCollector::LocalPortCollector(ICommandRunner* runner)
    : PortCollectorBase(runner)
{
}

std::vector<PortEntry> LocalPortCollector::collect(const std::optional<std::string>& remote_host) {
    auto output = run_capture({"lsof", "-i", "-P", "-n", "-sTCP:LISTEN", "-Fcpn"}, remote_host, true);
    if (!output) {
        return {};
    }

    auto entries = parse_lsof_fields(*output, remote_host.has_value());
    spdlog::debug("[local] {} listening ports", entries.size());
    return entries;
}

std::optional<uint16_t> LocalPortCollector::extract_port(const std::string& address) {
    const size_t colon = address.rfind(':');
    const std::string tail = colon == std::string::npos ? address : address.substr(colon + 1);
    return parse_port(tail);
}

std::vector<PortEntry> LocalPortCollector::parse_lsof_fields(const std::string& output, bool remote_mode) {
    std::vector<PortEntry> entries;
    std::optional<int> current_pid;
    std::string current_command;

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        const char field = line[0];
        const std::string value = line.substr(1);

        switch (field) {
            case 'p': {
                int pid = 0;
                auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), pid);
                if (ec == std::errc{} && ptr == value.data() + value.size()) {
                    current_pid = pid;
                } else {
                    current_pid.reset();
                }
                // A new process block resets the command
                current_command.clear();
                break;
            }
            case 'c':
                current_command = value;
                break;
            case 'n': {
                auto port = extract_port(value);
                if (!port) break;

                PortEntry entry;
                entry.source = PortSource::Local;
                entry.local_port = *port;
                entry.process_name = current_command;
                entry.pid = current_pid;
                entry.is_open = remote_mode;
                entries.push_back(std::move(entry));
                break;
            }
            default:
                break;
        }
    }

    // IPv4 and IPv6 sockets on the same port collapse to the first one seen
    std::stable_sort(entries.begin(), entries.end(), [](const PortEntry& a, const PortEntry& b) {
        return a.local_port < b.local_port;
    });
    auto last = std::unique(entries.begin(), entries.end(), [](const PortEntry& a, const PortEntry& b) {
        return a.local_port == b.local_port;
    });
    entries.erase(last, entries.end());

    return entries;
}

} // namespace quay
