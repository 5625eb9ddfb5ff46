#include "docker_port_collector.hpp"
#include "../shell_command.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <regex>
#include <set>
#include <sstream>

namespace quay {

namespace {

// [addr:]local[-local_end]->remote[-remote_end]/tcp
const std::regex kPortMappingRe(R"((?:[\d.:]+:)?(\d+)(?:-(\d+))?->(\d+)(?:-(\d+))?/tcp)");

std::vector<std::string> split_tabs(const std::string& line) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t tab = line.find('\t', start);
        if (tab == std::string::npos) {
            parts.push_back(line.substr(start));
            break;
        }
        parts.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return parts;
}

PortEntry make_published_entry(uint16_t local_port, std::optional<uint16_t> remote_port,
                               const std::string& id, const std::string& name, bool remote_mode) {
    PortEntry entry;
    entry.source = PortSource::Docker;
    entry.local_port = local_port;
    entry.remote_host = name;
    entry.remote_port = remote_port;
    entry.process_name = name;
    entry.container_id = id;
    entry.container_name = name;
    entry.is_open = remote_mode;
    return entry;
}

} // namespace

DockerPortCollector::DockerPortCollector(ICommandRunner* runner)
    : PortCollectorBase(runner)
{
}

std::vector<PortEntry> DockerPortCollector::collect(const std::optional<std::string>& remote_host) {
    auto output = run_capture({"docker", "ps", "--format", kPsFormat}, remote_host);
    if (!output) {
        return {};
    }

    auto entries = parse_docker_ps(*output, remote_host.has_value());
    spdlog::debug("[docker] {} published ports", entries.size());
    return entries;
}

std::vector<PortEntry> DockerPortCollector::collect_container(const std::string& container,
                                                              const std::optional<std::string>& remote_host) {
    auto output = run_capture({"docker", "exec", container, "ss", "-tln"}, remote_host);
    if (!output) {
        return {};
    }

    auto entries = parse_ss_output(*output, container);
    spdlog::debug("[docker] {} listening ports inside {}", entries.size(), container);
    return entries;
}

ContainerIpResult DockerPortCollector::get_container_ip(const std::string& container,
                                                        const std::optional<std::string>& remote_host) {
    ContainerIpResult result;
    const auto command = with_remote({"docker", "inspect", "-f", kInspectFormat, container}, remote_host);
    CommandResult run = runner_->run(command, remote_host ? kRemoteTimeout : kLocalTimeout);

    if (!run.launched) {
        result.error_message = run.error_message;
        return result;
    }
    if (!run.ok()) {
        result.error_message = fmt::format("Failed to get container IP for '{}': {}", container,
                                           run.timed_out ? "timed out" : trim(run.err));
        return result;
    }

    std::string ip = trim(run.out);
    if (ip.empty()) {
        result.error_message = fmt::format("Container '{}' has no IP address", container);
        return result;
    }
    result.ip = std::move(ip);
    return result;
}

std::vector<PortEntry> DockerPortCollector::parse_docker_ps(const std::string& output, bool remote_mode) {
    std::vector<PortEntry> entries;

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;

        const auto parts = split_tabs(line);
        if (parts.size() < 3) continue;

        const std::string& id = parts[0];
        const std::string& name = parts[1];
        const std::string& ports = parts[2];
        std::set<uint16_t> seen_ports;

        for (std::sregex_iterator it(ports.begin(), ports.end(), kPortMappingRe), end; it != end; ++it) {
            const auto& m = *it;
            auto local_start = parse_port(m[1].str());
            auto remote_start = parse_port(m[3].str());
            auto local_end = m[2].matched ? parse_port(m[2].str()) : std::nullopt;
            auto remote_end = m[4].matched ? parse_port(m[4].str()) : std::nullopt;

            if (local_start && remote_start && local_end && remote_end &&
                *local_end >= *local_start && *remote_end >= *remote_start) {
                const int count = std::min(*local_end - *local_start, *remote_end - *remote_start) + 1;
                for (int i = 0; i < count; ++i) {
                    const auto lp = static_cast<uint16_t>(*local_start + i);
                    const auto rp = static_cast<uint16_t>(*remote_start + i);
                    if (seen_ports.insert(lp).second) {
                        entries.push_back(make_published_entry(lp, rp, id, name, remote_mode));
                    }
                }
                continue;
            }

            if (local_start && seen_ports.insert(*local_start).second) {
                entries.push_back(make_published_entry(*local_start, remote_start, id, name, remote_mode));
            }
        }
    }

    return entries;
}

std::vector<PortEntry> DockerPortCollector::parse_ss_output(const std::string& output,
                                                            const std::string& container) {
    std::vector<PortEntry> entries;
    std::set<uint16_t> seen_ports;

    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        const std::string trimmed = trim(line);
        if (!trimmed.starts_with("LISTEN")) continue;

        const auto fields = split_whitespace(trimmed);
        if (fields.size() < 4) continue;

        const std::string& local_addr = fields[3];
        const size_t colon = local_addr.rfind(':');
        if (colon == std::string::npos) continue;

        auto port = parse_port(local_addr.substr(colon + 1));
        if (!port) continue;

        const std::string bind_addr = local_addr.substr(0, colon);
        const bool is_loopback = bind_addr == "127.0.0.1" || bind_addr == "[::1]";

        if (!seen_ports.insert(*port).second) continue;

        // users:(("nginx",pid=1,fd=6)) when ss was run with -p
        std::string process_name = container;
        if (fields.size() > 5) {
            std::string proc_field;
            for (size_t i = 5; i < fields.size(); ++i) {
                if (i > 5) proc_field += ' ';
                proc_field += fields[i];
            }
            const size_t start = proc_field.find("((\"");
            if (start != std::string::npos) {
                const size_t end = proc_field.find('"', start + 3);
                if (end != std::string::npos) {
                    process_name = proc_field.substr(start + 3, end - start - 3);
                }
            }
        }

        PortEntry entry;
        entry.source = PortSource::Docker;
        entry.local_port = *port;
        entry.remote_host = container;
        entry.remote_port = *port;
        entry.process_name = process_name;
        entry.container_name = container;
        entry.is_open = true;
        entry.is_loopback = is_loopback;
        entries.push_back(std::move(entry));
    }

    return entries;
}

} // namespace quay
