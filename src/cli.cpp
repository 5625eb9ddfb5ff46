#include "cli.hpp"
#include <fmt/format.h>
#include <getopt.h>
#include <charconv>
#include <cstring>

namespace quay {

namespace {

CliParseResult fail(std::string message) {
    CliParseResult result;
    result.error = std::move(message);
    return result;
}

std::string option_error(const char* command, int opt, char* argv[]) {
    if (opt == ':') {
        return fmt::format("{}: option '{}' requires an argument", command, argv[optind - 1]);
    }
    return fmt::format("{}: unknown option '{}'", command, argv[optind - 1]);
}

std::optional<std::string> parse_list(int argc, char* argv[], CliOptions& options) {
    static const option long_options[] = {
        {"json", no_argument, nullptr, 'j'},
        {"local", no_argument, nullptr, 'l'},
        {"ssh", no_argument, nullptr, 's'},
        {"docker", no_argument, nullptr, 'd'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, ":", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'j': options.json = true; break;
            case 'l': options.source_filter = PortSource::Local; break;
            case 's': options.source_filter = PortSource::Ssh; break;
            case 'd': options.source_filter = PortSource::Docker; break;
            default:
                return option_error("list", opt, argv);
        }
    }
    if (optind < argc) {
        return fmt::format("list: unexpected argument '{}'", argv[optind]);
    }
    return std::nullopt;
}

std::optional<std::string> parse_forward(int argc, char* argv[], CliOptions& options) {
    static const option long_options[] = {
        {"reverse", no_argument, nullptr, 'R'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, ":R", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'R': options.reverse = true; break;
            default:
                return option_error("forward", opt, argv);
        }
    }
    if (argc - optind != 2) {
        return std::string("forward: expected SPEC and HOST");
    }
    options.forward_spec = argv[optind];
    options.forward_host = argv[optind + 1];
    return std::nullopt;
}

std::optional<std::string> parse_kill(int argc, char* argv[], CliOptions& options) {
    static const option long_options[] = {
        {"pid", required_argument, nullptr, 'p'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, ":", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'p': {
                int pid = 0;
                const char* end = optarg + std::strlen(optarg);
                auto [ptr, ec] = std::from_chars(optarg, end, pid);
                if (ec != std::errc() || ptr != end || pid <= 0) {
                    return fmt::format("kill: invalid PID '{}'", optarg);
                }
                options.kill_pid = pid;
                break;
            }
            default:
                return option_error("kill", opt, argv);
        }
    }
    if (argc - optind != 1) {
        return std::string("kill: expected PORT");
    }
    auto port = parse_port(argv[optind]);
    if (!port) {
        return fmt::format("kill: invalid port '{}'", argv[optind]);
    }
    options.kill_port = *port;
    return std::nullopt;
}

} // namespace

CliParseResult parse_cli(int argc, char* argv[]) {
    static const option long_options[] = {
        {"remote", required_argument, nullptr, 'r'},
        {"docker", required_argument, nullptr, 'd'},
        {"mock", no_argument, nullptr, 'm'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {nullptr, 0, nullptr, 0}
    };

    CliOptions options;
    CliParseResult result;

    // '+' stops at the command name; ':' reports missing arguments as ':'
    optind = 0;
    opterr = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, "+:r:d:vhV", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'r': options.remote_host = optarg; break;
            case 'd': options.docker_target = optarg; break;
            case 'm': options.mock = true; break;
            case 'v': options.verbose = true; break;
            case 'h': result.show_help = true; return result;
            case 'V': result.show_version = true; return result;
            default:
                return fail(option_error("quay", opt, argv));
        }
    }

    if (optind >= argc) {
        result.options = options;
        return result;
    }

    const std::string command = argv[optind];
    const int sub_argc = argc - optind;
    char** sub_argv = argv + optind;
    optind = 0;

    std::optional<std::string> error;
    if (command == "list") {
        options.command = Command::List;
        error = parse_list(sub_argc, sub_argv, options);
    } else if (command == "forward") {
        options.command = Command::Forward;
        error = parse_forward(sub_argc, sub_argv, options);
    } else if (command == "kill") {
        options.command = Command::Kill;
        error = parse_kill(sub_argc, sub_argv, options);
    } else {
        return fail(fmt::format("unknown command '{}'", command));
    }

    if (error) {
        return fail(*error);
    }
    result.options = options;
    return result;
}

std::string usage_text() {
    return
        "Usage: quay [options] [command]\n"
        "\n"
        "Interactive dashboard for local listening ports, SSH forwards and Docker ports.\n"
        "\n"
        "Options:\n"
        "  -r, --remote HOST       Scan ports on HOST over ssh (e.g. user@server)\n"
        "  -d, --docker CONTAINER  Scan ports inside CONTAINER\n"
        "      --mock              Run the dashboard on demo data\n"
        "  -v, --verbose           Debug logging\n"
        "  -h, --help              Show this help\n"
        "  -V, --version           Show the version\n"
        "\n"
        "Commands:\n"
        "  list [--json] [--local|--ssh|--docker]   List ports and exit\n"
        "  forward SPEC HOST [-R|--reverse]         Start ssh -f -N -L|-R SPEC HOST\n"
        "  kill PORT [--pid PID]                    Kill the process on PORT (or PID)\n";
}

} // namespace quay
