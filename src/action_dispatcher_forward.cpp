#include "action_dispatcher.hpp"
#include "mock_data.hpp"
#include "shell_command.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace quay {

void ActionDispatcher::add_mock_forward(SessionState& state, PortEntry entry) {
    auto entries = state.all_records;
    entries.push_back(std::move(entry));
    sort_entries(entries);
    state.set_records(std::move(entries));
}

void ActionDispatcher::submit_forward(SessionState& state) {
    const auto& draft = state.forward_draft;
    auto spec = draft.to_spec();
    if (!spec) {
        // Leave the popup open so the fields can be fixed
        state.set_status(fmt::format("Invalid forward: {}", fmt::join(draft.invalid_field_names(), ", ")));
        return;
    }

    if (mock_mode_) {
        add_mock_forward(state, make_mock_forward_entry(*parse_port(draft.local_port),
                                                        trim(draft.remote_host),
                                                        parse_port(draft.remote_port),
                                                        trim(draft.ssh_host)));
        state.close_popup();
        state.set_status("[mock] Forward created");
        return;
    }

    state.close_popup();

    ForwardResult result = forwarder_->create_forward(spec->spec, spec->host, false);
    if (!result.success) {
        state.set_status(fmt::format("Forward failed: {}", result.error_message));
        return;
    }

    spdlog::info("forward {} via {} started (pid {})", spec->spec, spec->host, result.pid);
    state.set_status(fmt::format("Forward created (PID: {})", result.pid));
    reload(state, "Refresh failed");
}

void ActionDispatcher::quick_forward(SessionState& state) {
    const PortEntry* selected = state.selected_record();
    if (!selected) {
        return;
    }
    const uint16_t port = selected->local_port;

    if (!state.target.remote_host) {
        state.set_status(state.is_docker_target() ? "Quick Forward for local Docker not yet supported"
                                                  : "Quick Forward requires --remote mode");
        return;
    }
    const std::string host = *state.target.remote_host;

    // Docker target: the container's own address on the remote host
    std::string forward_target = "localhost";
    if (state.is_docker_target()) {
        if (!state.container_ip) {
            state.set_status("Container IP not available");
            return;
        }
        forward_target = *state.container_ip;
    }

    if (mock_mode_) {
        add_mock_forward(state, make_mock_forward_entry(port, forward_target, port, host));
        state.set_status(fmt::format("[mock] Forward :{} -> {}:{}", port, host, port));
        return;
    }

    const std::string spec = fmt::format("{}:{}:{}", port, forward_target, port);
    ForwardResult result = forwarder_->create_forward(spec, host, false);
    if (!result.success) {
        state.set_status(fmt::format("Forward failed: {}", result.error_message));
        return;
    }

    spdlog::info("quick forward {} via {} started (pid {})", spec, host, result.pid);
    state.set_status(fmt::format("Forward :{} -> {}:{} (PID: {})", port, host, port, result.pid));
    reload(state, "Refresh failed");
}

void ActionDispatcher::launch_preset(SessionState& state) {
    const Preset* preset = state.selected_preset();
    if (!preset) {
        state.close_popup();
        return;
    }
    const Preset chosen = *preset;
    state.close_popup();

    if (mock_mode_) {
        add_mock_forward(state, make_mock_forward_entry(chosen.local_port, chosen.remote_host,
                                                        chosen.remote_port, chosen.ssh_host));
        state.set_status("[mock] Forward created");
        return;
    }

    ForwardResult result = forwarder_->create_forward(chosen.spec(), chosen.ssh_host, false);
    if (!result.success) {
        state.set_status(fmt::format("Forward failed: {}", result.error_message));
        return;
    }

    spdlog::info("preset '{}' started (pid {})", chosen.name, result.pid);
    state.set_status(fmt::format("Forward created (PID: {})", result.pid));
    reload(state, "Refresh failed");
}

} // namespace quay
