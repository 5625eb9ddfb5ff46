#include "action_dispatcher.hpp"
#include "mock_data.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace quay {

ActionDispatcher::ActionDispatcher(PortReconciler* reconciler,
                                   IPortKiller* killer,
                                   IForwardLauncher* forwarder,
                                   Connections* connections,
                                   bool mock_mode)
    : reconciler_(reconciler)
    , killer_(killer)
    , forwarder_(forwarder)
    , connections_(connections)
    , mock_mode_(mock_mode)
{
}

void ActionDispatcher::start(SessionState& state) {
    state.mock_mode = mock_mode_;
    if (mock_mode_) {
        state.auto_refresh = false;
        state.set_records(make_mock_entries());
        state.set_status("[mock] Loaded mock data");
        return;
    }

    resolve_container_ip(state);
    reload(state, "Load failed");
}

bool ActionDispatcher::handle_key(SessionState& state, int ch) {
    auto action = map_key(state, ch);
    if (!action) {
        return false;
    }
    dispatch(state, *action);
    return true;
}

void ActionDispatcher::on_tick(SessionState& state) {
    state.tick();
    if (!mock_mode_ && state.should_refresh()) {
        reload(state, "Auto-refresh failed");
    }
}

bool ActionDispatcher::reload(SessionState& state, const std::string& failure_prefix) {
    auto entries = reconciler_->collect_all(state.target);
    const auto& errors = reconciler_->last_errors();

    if (entries.empty() && !errors.empty()) {
        state.set_records({});
        if (!no_data_reported_) {
            state.set_status(fmt::format("{}: {}", failure_prefix, errors.front().message));
            no_data_reported_ = true;
        }
        return false;
    }

    no_data_reported_ = false;
    state.set_records(std::move(entries));
    return true;
}

void ActionDispatcher::resolve_container_ip(SessionState& state) {
    state.container_ip.reset();
    if (!state.is_docker_target()) {
        return;
    }

    auto result = reconciler_->get_container_ip(state.target);
    if (result.ip) {
        spdlog::debug("container {} has address {}", *state.target.docker_target, *result.ip);
        state.container_ip = std::move(result.ip);
    } else {
        state.set_status(fmt::format("Container IP lookup failed: {}", result.error_message));
    }
}

void ActionDispatcher::dispatch(SessionState& state, const Action& action) {
    switch (state.popup) {
        case Popup::ForwardDraft:
            dispatch_forward_popup(state, action);
            return;
        case Popup::Presets:
            dispatch_presets_popup(state, action);
            return;
        case Popup::Connections:
            dispatch_connections_popup(state, action);
            return;
        case Popup::Details:
        case Popup::Help:
            if (action.type == ActionType::ClosePopup) {
                state.close_popup();
            }
            return;
        case Popup::None:
            break;
    }

    switch (action.type) {
        case ActionType::Quit:
            state.should_quit = true;
            break;

        case ActionType::MoveDown: state.next(); break;
        case ActionType::MoveUp: state.previous(); break;
        case ActionType::First: state.first(); break;
        case ActionType::Last: state.last(); break;

        case ActionType::ShowDetails:
            if (state.selected_record()) {
                state.popup = Popup::Details;
            }
            break;

        case ActionType::ShowHelp:
            state.popup = Popup::Help;
            break;

        case ActionType::Refresh:
            refresh(state);
            break;

        case ActionType::ToggleAutoRefresh:
            toggle_auto_refresh(state);
            break;

        case ActionType::EnterSearch:
            state.input_mode = InputMode::Search;
            break;

        case ActionType::ExitSearch:
            state.input_mode = InputMode::Normal;
            break;

        case ActionType::SearchAppend:
            state.search_query.push_back(static_cast<char>(action.ch));
            state.apply_filter();
            break;

        case ActionType::SearchBackspace:
            if (!state.search_query.empty()) {
                state.search_query.pop_back();
            }
            state.apply_filter();
            break;

        case ActionType::SetFilter:
            if (action.ch >= 0 && action.ch <= 3) {
                state.set_filter(static_cast<Filter>(action.ch));
            }
            break;

        case ActionType::Kill:
            kill_selected(state);
            break;

        case ActionType::StartForward:
            state.open_forward_draft();
            break;

        case ActionType::QuickForward:
            quick_forward(state);
            break;

        case ActionType::OpenPresets:
            state.preset_selected = 0;
            state.popup = Popup::Presets;
            break;

        case ActionType::OpenConnections:
            state.connection_selected = state.active_connection_index;
            state.connection_popup_mode = ConnectionPopupMode::List;
            state.reset_connection_draft();
            state.popup = Popup::Connections;
            break;

        case ActionType::NextConnection:
            if (state.has_multiple_connections()) {
                state.next_connection();
                switch_connection(state);
            }
            break;

        case ActionType::PrevConnection:
            if (state.has_multiple_connections()) {
                state.prev_connection();
                switch_connection(state);
            }
            break;

        case ActionType::ClosePopup:
            state.close_popup();
            break;

        default:
            break;
    }
}

void ActionDispatcher::refresh(SessionState& state) {
    if (mock_mode_) {
        return;
    }

    // A manual refresh always reports its outcome
    no_data_reported_ = false;
    if (reload(state, "Refresh failed")) {
        state.set_status("Refreshed");
    }
}

void ActionDispatcher::toggle_auto_refresh(SessionState& state) {
    if (mock_mode_) {
        return;
    }
    state.auto_refresh = !state.auto_refresh;
    state.set_status(state.auto_refresh ? "Auto-refresh ON" : "Auto-refresh OFF");
}

void ActionDispatcher::switch_connection(SessionState& state) {
    state.apply_connection();
    const auto* conn = state.active_connection();
    const std::string name = conn ? conn->name : "Local";
    spdlog::info("switching to connection '{}'", name);

    if (mock_mode_) {
        state.set_status(fmt::format("[mock] Connection: {}", name));
        return;
    }

    state.set_status(fmt::format("Connection: {}", name));
    resolve_container_ip(state);
    no_data_reported_ = false;
    reload(state, "Load failed");
}

void ActionDispatcher::dispatch_forward_popup(SessionState& state, const Action& action) {
    auto& draft = state.forward_draft;
    switch (action.type) {
        case ActionType::ClosePopup:
            state.close_popup();
            break;
        case ActionType::SubmitForward:
            submit_forward(state);
            break;
        case ActionType::NextField:
            draft.next_field();
            break;
        case ActionType::PrevField:
            draft.prev_field();
            break;
        case ActionType::InsertChar:
            draft.insert_char(static_cast<char>(action.ch));
            break;
        case ActionType::DeleteChar:
            draft.backspace();
            break;
        default:
            break;
    }
}

void ActionDispatcher::dispatch_presets_popup(SessionState& state, const Action& action) {
    switch (action.type) {
        case ActionType::ClosePopup:
            state.close_popup();
            break;
        case ActionType::PresetDown:
            state.preset_next();
            break;
        case ActionType::PresetUp:
            state.preset_previous();
            break;
        case ActionType::LaunchPreset:
            launch_preset(state);
            break;
        default:
            break;
    }
}

void ActionDispatcher::dispatch_connections_popup(SessionState& state, const Action& action) {
    if (state.connection_popup_mode == ConnectionPopupMode::AddNew) {
        auto& draft = state.connection_draft;
        switch (action.type) {
            case ActionType::CancelAddConnection:
                state.reset_connection_draft();
                state.connection_popup_mode = ConnectionPopupMode::List;
                break;
            case ActionType::SubmitConnection:
                add_connection(state);
                break;
            case ActionType::NextField:
                draft.next_field();
                break;
            case ActionType::PrevField:
                draft.prev_field();
                break;
            case ActionType::InsertChar:
                draft.active_value().push_back(static_cast<char>(action.ch));
                break;
            case ActionType::DeleteChar:
                if (auto& value = draft.active_value(); !value.empty()) {
                    value.pop_back();
                }
                break;
            default:
                break;
        }
        return;
    }

    switch (action.type) {
        case ActionType::ClosePopup:
            state.close_popup();
            break;
        case ActionType::ConnectionDown:
            state.connection_next();
            break;
        case ActionType::ConnectionUp:
            state.connection_previous();
            break;
        case ActionType::ActivateConnection:
            if (state.connection_selected < state.connections.size()) {
                state.active_connection_index = state.connection_selected;
                state.close_popup();
                switch_connection(state);
            }
            break;
        case ActionType::AddConnection:
            state.reset_connection_draft();
            state.connection_popup_mode = ConnectionPopupMode::AddNew;
            break;
        case ActionType::DeleteConnection:
            delete_connection(state);
            break;
        default:
            break;
    }
}

void ActionDispatcher::add_connection(SessionState& state) {
    auto conn = state.connection_draft.to_connection();
    if (!conn) {
        state.set_status("Connection name is required");
        return;
    }

    const std::string name = conn->name;
    if (connections_) {
        connections_->add(*conn);
        save_connections();
        state.connections = connections_->all_with_local();
    } else {
        state.connections.push_back(std::move(*conn));
    }

    state.connection_selected = state.connections.size() - 1;
    state.connection_popup_mode = ConnectionPopupMode::List;
    state.reset_connection_draft();
    state.set_status(fmt::format("Added connection '{}'", name));
}

void ActionDispatcher::delete_connection(SessionState& state) {
    const size_t index = state.connection_selected;
    if (index == 0) {
        state.set_status("Cannot delete the Local connection");
        return;
    }
    if (index >= state.connections.size()) {
        return;
    }

    const std::string name = state.connections[index].name;
    if (connections_) {
        connections_->remove(index - 1);
        save_connections();
        state.connections = connections_->all_with_local();
    } else {
        state.connections.erase(state.connections.begin() + static_cast<std::ptrdiff_t>(index));
    }

    if (state.connection_selected >= state.connections.size()) {
        state.connection_selected = state.connections.size() - 1;
    }

    state.set_status(fmt::format("Deleted connection '{}'", name));

    if (state.active_connection_index == index) {
        state.active_connection_index = 0;
        switch_connection(state);
    } else if (state.active_connection_index > index) {
        --state.active_connection_index;
    }
}

void ActionDispatcher::save_connections() {
    if (mock_mode_ || !connections_) {
        return;
    }
    const bool saved = connections_path_ ? connections_->save_to(*connections_path_) : connections_->save();
    if (!saved) {
        spdlog::warn("connections could not be saved");
    }
}

} // namespace quay
