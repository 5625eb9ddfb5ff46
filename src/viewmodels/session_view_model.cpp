#include "session_view_model.hpp"
#include <algorithm>

namespace quay {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

} // namespace

const char* filter_label(Filter filter) {
    switch (filter) {
        case Filter::All: return "All";
        case Filter::Local: return "Local";
        case Filter::Ssh: return "SSH";
        case Filter::Docker: return "Docker";
    }
    return "All";
}

Filter filter_from_string(const std::string& text) {
    const std::string lower = to_lower(text);
    if (lower == "local") return Filter::Local;
    if (lower == "ssh") return Filter::Ssh;
    if (lower == "docker") return Filter::Docker;
    return Filter::All;
}

void SessionState::set_records(std::vector<PortEntry> records) {
    all_records = std::move(records);
    apply_filter();
}

bool SessionState::matches(const PortEntry& entry) const {
    switch (filter) {
        case Filter::All:
            break;
        case Filter::Local:
            if (entry.source != PortSource::Local) return false;
            break;
        case Filter::Ssh:
            if (entry.source != PortSource::Ssh) return false;
            break;
        case Filter::Docker:
            if (entry.source != PortSource::Docker) return false;
            break;
    }

    if (search_query.empty()) {
        return true;
    }

    const std::string query = to_lower(search_query);
    if (to_lower(entry.process_name).find(query) != std::string::npos) return true;
    if (std::to_string(entry.local_port).find(query) != std::string::npos) return true;
    if (entry.remote_host && to_lower(*entry.remote_host).find(query) != std::string::npos) return true;
    return false;
}

void SessionState::apply_filter() {
    view.clear();
    for (const auto& entry : all_records) {
        if (matches(entry)) {
            view.push_back(entry);
        }
    }

    if (selected_index >= view.size()) {
        selected_index = view.empty() ? 0 : view.size() - 1;
    }
}

void SessionState::set_filter(Filter new_filter) {
    filter = new_filter;
    apply_filter();
}

const PortEntry* SessionState::selected_record() const {
    if (selected_index < view.size()) {
        return &view[selected_index];
    }
    return nullptr;
}

void SessionState::next() {
    if (!view.empty()) {
        selected_index = (selected_index + 1) % view.size();
    }
}

void SessionState::previous() {
    if (!view.empty()) {
        selected_index = selected_index == 0 ? view.size() - 1 : selected_index - 1;
    }
}

void SessionState::first() {
    selected_index = 0;
}

void SessionState::last() {
    if (!view.empty()) {
        selected_index = view.size() - 1;
    }
}

void SessionState::select_row(size_t row) {
    if (row < view.size()) {
        selected_index = row;
    }
}

void SessionState::set_status(const std::string& message) {
    status = StatusMessage{message, kStatusTicks};
}

void SessionState::tick() {
    ++tick_count;
    if (status) {
        if (status->ticks_remaining > 0) {
            --status->ticks_remaining;
        }
        if (status->ticks_remaining == 0) {
            status.reset();
        }
    }
}

bool SessionState::should_refresh() const {
    return auto_refresh && tick_count > 0 && refresh_period_ticks > 0 &&
           tick_count % refresh_period_ticks == 0;
}

void SessionState::preset_next() {
    if (!presets.empty()) {
        preset_selected = (preset_selected + 1) % presets.size();
    }
}

void SessionState::preset_previous() {
    if (!presets.empty()) {
        preset_selected = preset_selected == 0 ? presets.size() - 1 : preset_selected - 1;
    }
}

const Preset* SessionState::selected_preset() const {
    if (preset_selected < presets.size()) {
        return &presets[preset_selected];
    }
    return nullptr;
}

const Connection* SessionState::active_connection() const {
    if (active_connection_index < connections.size()) {
        return &connections[active_connection_index];
    }
    return nullptr;
}

void SessionState::next_connection() {
    if (!connections.empty()) {
        active_connection_index = (active_connection_index + 1) % connections.size();
    }
}

void SessionState::prev_connection() {
    if (!connections.empty()) {
        active_connection_index = active_connection_index == 0 ? connections.size() - 1
                                                               : active_connection_index - 1;
    }
}

void SessionState::apply_connection() {
    if (const auto* conn = active_connection()) {
        target = conn->target();
        container_ip.reset();
    }
}

void SessionState::connection_next() {
    if (!connections.empty()) {
        connection_selected = (connection_selected + 1) % connections.size();
    }
}

void SessionState::connection_previous() {
    if (!connections.empty()) {
        connection_selected = connection_selected == 0 ? connections.size() - 1 : connection_selected - 1;
    }
}

void SessionState::open_forward_draft() {
    const std::optional<std::string> ip = is_docker_target() ? container_ip : std::nullopt;
    forward_draft = ForwardDraft::for_session(selected_record(), target.remote_host, ip);
    popup = Popup::ForwardDraft;
}

void SessionState::close_popup() {
    if (popup == Popup::ForwardDraft) {
        reset_forward_draft();
    }
    if (popup == Popup::Connections) {
        reset_connection_draft();
        connection_popup_mode = ConnectionPopupMode::List;
    }
    popup = Popup::None;
}

} // namespace quay
