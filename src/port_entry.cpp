#include "port_entry.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <charconv>

namespace quay {

std::string source_to_string(PortSource source) {
    switch (source) {
        case PortSource::Local:
            return "LOCAL";
        case PortSource::Ssh:
            return "SSH";
        case PortSource::Docker:
            return "DOCKER";
    }
    return "UNKNOWN";
}

std::string source_tag(PortSource source) {
    switch (source) {
        case PortSource::Local:
            return "Local";
        case PortSource::Ssh:
            return "Ssh";
        case PortSource::Docker:
            return "Docker";
    }
    return "Unknown";
}

std::optional<PortSource> source_from_string(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "local") return PortSource::Local;
    if (lower == "ssh") return PortSource::Ssh;
    if (lower == "docker") return PortSource::Docker;
    return std::nullopt;
}

std::string remote_display(const PortEntry& entry) {
    if (!entry.remote_host) {
        return "-";
    }
    if (entry.remote_port) {
        return fmt::format("{}:{}", *entry.remote_host, *entry.remote_port);
    }
    return *entry.remote_host;
}

std::string process_display(const PortEntry& entry) {
    if (entry.source == PortSource::Docker && entry.container_id) {
        const std::string name = entry.container_name.value_or("unknown");
        const std::string short_id = entry.container_id ? entry.container_id->substr(0, 8) : "";
        return fmt::format("{} ({})", name, short_id);
    }
    if (entry.pid) {
        return fmt::format("{} (pid:{})", entry.process_name, *entry.pid);
    }
    return entry.process_name;
}

void sort_entries(std::vector<PortEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const PortEntry& a, const PortEntry& b) {
        if (a.is_open != b.is_open) {
            return a.is_open;
        }
        return a.local_port < b.local_port;
    });
}

std::optional<uint16_t> parse_port(const std::string& text) {
    if (text.empty()) return std::nullopt;

    unsigned int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    if (value == 0 || value > 65535) return std::nullopt;
    return static_cast<uint16_t>(value);
}

} // namespace quay
