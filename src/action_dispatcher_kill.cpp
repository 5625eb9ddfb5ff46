#include "action_dispatcher.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace quay {

void ActionDispatcher::kill_selected(SessionState& state) {
    const PortEntry* selected = state.selected_record();
    if (!selected) {
        return;
    }
    const PortEntry entry = *selected;
    const uint16_t port = entry.local_port;

    if (mock_mode_) {
        auto entries = state.all_records;
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [port](const PortEntry& e) { return e.local_port == port; }),
                      entries.end());
        state.set_records(std::move(entries));
        state.set_status(fmt::format("[mock] Removed port {}", port));
        return;
    }

    KillResult result = killer_->kill_entry(entry, state.target);
    if (!result.success) {
        // Container kills already carry a complete message
        if (state.is_docker_target()) {
            state.set_status(result.error_message);
        } else {
            state.set_status(fmt::format("Kill failed: {}", result.error_message));
        }
        return;
    }

    if (state.is_docker_target()) {
        state.set_status(fmt::format("Killed PID {} in container", entry.pid.value_or(0)));
    } else {
        state.set_status(fmt::format("Killed process on port {}", port));
    }
    spdlog::info("killed {} entry on port {}", source_tag(entry.source), port);

    reload(state, "Refresh failed");
}

} // namespace quay
