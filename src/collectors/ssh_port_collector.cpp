#include "ssh_port_collector.hpp"
#include "../shell_command.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <regex>
#include <sstream>

namespace quay {

namespace {

// -L local_port:remote_host:remote_port
const std::regex kLocalForwardRe(R"(-L\s*(\d+):([^:\s]+):(\d+))");
// -R remote_port:local_host:local_port
const std::regex kRemoteForwardRe(R"(-R\s*(\d+):([^:\s]+):(\d+))");

std::optional<int> parse_pid(const std::string& text) {
    int pid = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), pid);
    if (ec != std::errc{} || ptr != text.data() + text.size() || pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

} // namespace

SshPortCollector::SshPortCollector(ICommandRunner* runner)
    : PortCollectorBase(runner)
{
}

std::vector<PortEntry> SshPortCollector::collect([[maybe_unused]] const std::optional<std::string>& remote_host) {
    auto output = run_capture({"ps", "aux"}, std::nullopt);
    if (!output) {
        return {};
    }

    auto entries = parse_ssh_forwards(*output);
    spdlog::debug("[ssh] {} forwards", entries.size());
    return entries;
}

std::optional<std::string> SshPortCollector::extract_ssh_host(const std::string& line) {
    const auto tokens = split_whitespace(line);

    size_t ssh_pos = tokens.size();
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        const size_t slash = token.rfind('/');
        const std::string base = slash == std::string::npos ? token : token.substr(slash + 1);
        if (base == "ssh") {
            ssh_pos = i;
            break;
        }
    }

    if (ssh_pos + 1 >= tokens.size()) {
        return std::nullopt;
    }

    const auto& last = tokens.back();
    if (last.starts_with('-') || last.find(':') != std::string::npos) {
        return std::nullopt;
    }
    return last;
}

std::vector<PortEntry> SshPortCollector::parse_ssh_forwards(const std::string& ps_output) {
    std::vector<PortEntry> entries;

    std::istringstream stream(ps_output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.find("ssh") == std::string::npos) continue;
        if (line.find("-L") == std::string::npos && line.find("-R") == std::string::npos) continue;

        const auto parts = split_whitespace(line);
        if (parts.size() < 2) continue;

        const auto pid = parse_pid(parts[1]);
        const auto ssh_host = extract_ssh_host(line);

        for (std::sregex_iterator it(line.begin(), line.end(), kLocalForwardRe), end; it != end; ++it) {
            const auto& m = *it;
            auto local_port = parse_port(m[1].str());
            if (!local_port) continue;

            PortEntry entry;
            entry.source = PortSource::Ssh;
            entry.local_port = *local_port;
            entry.remote_host = m[2].str();
            entry.remote_port = parse_port(m[3].str());
            entry.process_name = "ssh";
            entry.pid = pid;
            entry.ssh_host = ssh_host;
            entries.push_back(std::move(entry));
        }

        // Reverse forwards are listed by their locally bound side
        for (std::sregex_iterator it(line.begin(), line.end(), kRemoteForwardRe), end; it != end; ++it) {
            const auto& m = *it;
            auto local_port = parse_port(m[3].str());
            if (!local_port) continue;

            const auto remote_port = parse_port(m[1].str());

            PortEntry entry;
            entry.source = PortSource::Ssh;
            entry.local_port = *local_port;
            entry.remote_host = fmt::format("(R) {}:{}", m[2].str(), m[1].str());
            entry.remote_port = remote_port;
            entry.process_name = "ssh -R";
            entry.pid = pid;
            entry.ssh_host = ssh_host;
            entries.push_back(std::move(entry));
        }
    }

    return entries;
}

} // namespace quay
