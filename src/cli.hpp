#pragma once

#include "port_entry.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace quay {

enum class Command {
    Dashboard,
    List,
    Forward,
    Kill
};

struct CliOptions {
    std::optional<std::string> remote_host;
    std::optional<std::string> docker_target;
    bool mock = false;
    bool verbose = false;

    Command command = Command::Dashboard;

    // list
    bool json = false;
    std::optional<PortSource> source_filter;

    // forward
    std::string forward_spec;
    std::string forward_host;
    bool reverse = false;

    // kill
    uint16_t kill_port = 0;
    std::optional<int> kill_pid;
};

struct CliParseResult {
    std::optional<CliOptions> options;   // unset on error, --help or --version
    bool show_help = false;
    bool show_version = false;
    std::string error;
};

// Global options come before the command; each command takes its own.
// Uses getopt_long, so argv may be permuted.
CliParseResult parse_cli(int argc, char* argv[]);

std::string usage_text();

} // namespace quay
