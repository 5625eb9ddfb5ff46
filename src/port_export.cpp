#include "port_export.hpp"
#include <fmt/format.h>

namespace quay {

namespace {

template <typename T>
nlohmann::json optional_json(const std::optional<T>& value) {
    if (value) {
        return *value;
    }
    return nullptr;
}

} // namespace

std::vector<PortEntry> filter_by_source(const std::vector<PortEntry>& entries,
                                        std::optional<PortSource> source) {
    if (!source) {
        return entries;
    }
    std::vector<PortEntry> result;
    for (const auto& entry : entries) {
        if (entry.source == *source) {
            result.push_back(entry);
        }
    }
    return result;
}

nlohmann::json entry_to_json(const PortEntry& entry) {
    return {
        {"source", source_tag(entry.source)},
        {"local_port", entry.local_port},
        {"is_open", entry.is_open},
        {"remote_host", optional_json(entry.remote_host)},
        {"remote_port", optional_json(entry.remote_port)},
        {"process_name", entry.process_name},
        {"pid", optional_json(entry.pid)},
        {"container_id", optional_json(entry.container_id)},
        {"container_name", optional_json(entry.container_name)},
        {"ssh_host", optional_json(entry.ssh_host)},
        {"is_loopback", entry.is_loopback},
    };
}

nlohmann::json entries_to_json(const std::vector<PortEntry>& entries) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& entry : entries) {
        array.push_back(entry_to_json(entry));
    }
    return array;
}

std::string format_table(const std::vector<PortEntry>& entries) {
    std::string out = fmt::format("{:<8} {:<6} {:<8} {:<20} PROCESS\n", "TYPE", "OPEN", "LOCAL", "REMOTE");
    out += std::string(66, '-');
    out += '\n';

    for (const auto& entry : entries) {
        // The indicator is one column wide but three bytes long
        const char* indicator = entry.is_open ? "●     " : "○     ";
        out += fmt::format("{:<8} {} :{:<7} {:<20} {}\n",
                           source_to_string(entry.source),
                           indicator,
                           entry.local_port,
                           remote_display(entry),
                           process_display(entry));
    }
    return out;
}

} // namespace quay
