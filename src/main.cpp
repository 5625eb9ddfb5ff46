#include "platform_factory.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "preset.hpp"
#include "logging.hpp"
#include "port_export.hpp"
#include "port_killer.hpp"
#include "port_reconciler.hpp"
#include "ssh_forwarder.hpp"
#include "action_dispatcher.hpp"
#include "collectors/local_port_collector.hpp"
#include "collectors/ssh_port_collector.hpp"
#include "collectors/docker_port_collector.hpp"
#include "tui/tui_app.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <clocale>
#include <iostream>
#include <memory>

#ifndef QUAY_VERSION
#define QUAY_VERSION "0.0.0"
#endif

namespace {

int run_list(quay::PortReconciler& reconciler, const quay::CliOptions& cli, const quay::Target& target) {
    auto entries = quay::filter_by_source(reconciler.collect_all(target), cli.source_filter);
    if (cli.json) {
        std::cout << quay::entries_to_json(entries).dump(2) << std::endl;
    } else {
        std::cout << quay::format_table(entries);
    }
    return 0;
}

int run_forward(quay::IForwardLauncher& forwarder, const quay::CliOptions& cli) {
    std::cout << "Creating SSH forward: ssh -f -N " << (cli.reverse ? "-R " : "-L ")
              << cli.forward_spec << " " << cli.forward_host << std::endl;

    auto result = forwarder.create_forward(cli.forward_spec, cli.forward_host, cli.reverse);
    if (!result.success) {
        std::cerr << "Failed to create forward: " << result.error_message << std::endl;
        return 1;
    }
    std::cout << "Started with PID: " << result.pid << std::endl;
    return 0;
}

int run_kill(quay::PortReconciler& reconciler, quay::IPortKiller& killer,
             const quay::CliOptions& cli, const std::optional<std::string>& remote_host) {
    quay::KillResult result;

    if (cli.kill_pid) {
        std::cout << "Killing process with PID: " << *cli.kill_pid << "..." << std::endl;
        result = killer.kill_pid(*cli.kill_pid, remote_host);
    } else {
        std::cout << "Killing process on port: " << cli.kill_port << "..." << std::endl;

        // Container targets are a dashboard feature; here only the host is searched
        const quay::Target target{remote_host, std::nullopt};
        auto entries = reconciler.collect_all(target);
        auto it = std::find_if(entries.begin(), entries.end(), [&](const quay::PortEntry& e) {
            return e.local_port == cli.kill_port;
        });
        if (it == entries.end()) {
            std::cerr << "No process found on port " << cli.kill_port << std::endl;
            return 1;
        }
        result = killer.kill_entry(*it, target);
    }

    if (!result.success) {
        std::cerr << "Kill failed: " << result.error_message << std::endl;
        return 1;
    }
    std::cout << "Done." << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = quay::parse_cli(argc, argv);
    if (parsed.show_help) {
        std::cout << quay::usage_text();
        return 0;
    }
    if (parsed.show_version) {
        std::cout << "quay " << QUAY_VERSION << std::endl;
        return 0;
    }
    if (!parsed.options) {
        std::cerr << "quay: " << parsed.error << "\n\n" << quay::usage_text();
        return 2;
    }
    const quay::CliOptions& cli = *parsed.options;
    const bool interactive = cli.command == quay::Command::Dashboard;

    quay::logging::init({cli.verbose ? "debug" : "info", !interactive, std::nullopt});

    auto config = quay::Config::load();
    if (!cli.verbose) {
        quay::logging::set_level(config.general.log_level);
    }

    // Command line flags take precedence over the config file
    quay::Target target;
    target.remote_host = cli.remote_host ? cli.remote_host : config.general.remote_host;
    target.docker_target = cli.docker_target ? cli.docker_target : config.general.docker_target;

    try {
        // Platform pieces (owned here in main)
        auto runner = quay::make_command_runner();
        auto prober = quay::make_port_prober();

        quay::LocalPortCollector local(runner.get());
        quay::DockerPortCollector docker(runner.get());
        quay::SshPortCollector ssh(runner.get());
        quay::PortReconciler reconciler(&local, &docker, &ssh, &docker, prober.get());
        quay::PortKiller killer(runner.get());
        quay::SshForwarder forwarder(runner.get());

        switch (cli.command) {
            case quay::Command::List:
                return run_list(reconciler, cli, target);
            case quay::Command::Forward:
                return run_forward(forwarder, cli);
            case quay::Command::Kill:
                return run_kill(reconciler, killer, cli, target.remote_host);
            case quay::Command::Dashboard:
                break;
        }

        spdlog::info("quay {} starting (remote: {}, docker: {}, mock: {})", QUAY_VERSION,
                     target.remote_host.value_or("-"), target.docker_target.value_or("-"), cli.mock);

        quay::Connections connections = quay::Connections::load();

        quay::SessionState state;
        state.target = target;
        state.connections = connections.all_with_local();
        state.presets = quay::Presets::load().preset;
        state.auto_refresh = !cli.mock && config.general.auto_refresh;
        state.refresh_period_ticks = config.refresh_ticks();
        state.filter = quay::filter_from_string(config.general.default_filter);

        quay::ActionDispatcher dispatcher(&reconciler, &killer, &forwarder, &connections, cli.mock);

        // UTF-8 liveness markers
        std::setlocale(LC_ALL, "");

        quay::TuiApp app(&state, &dispatcher, config.ui.mouse_enabled);
        app.run();

        spdlog::info("quay exiting");
        return 0;
    } catch (const std::exception& e) {
        // Make sure we restore terminal state before printing error
        if (interactive) {
            endwin();
        }
        spdlog::error("fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
