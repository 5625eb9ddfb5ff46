#pragma once

#include "port_reconciler.hpp"
#include "key_bindings.hpp"
#include "connection.hpp"
#include "interfaces/i_port_killer.hpp"
#include "interfaces/i_forward_launcher.hpp"
#include "viewmodels/session_view_model.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace quay {

// Applies actions to the session and runs their side effects. Owns no state
// of its own beyond bookkeeping; the session is passed in by reference on
// every call and only touched from the event loop thread.
//
// Non-owning: all collaborators must outlive the dispatcher. connections may
// be null, in which case bookmark edits are not persisted.
class ActionDispatcher {
public:
    ActionDispatcher(PortReconciler* reconciler,
                     IPortKiller* killer,
                     IForwardLauncher* forwarder,
                     Connections* connections,
                     bool mock_mode);

    // Initial load: container IP lookup, then the first collection (or the
    // demo set in mock mode)
    void start(SessionState& state);

    // Maps ch through the session's current key map and dispatches it.
    // Returns false when the key is unbound.
    bool handle_key(SessionState& state, int ch);

    void dispatch(SessionState& state, const Action& action);

    // One 250 ms tick: ages the status and auto-refreshes when due
    void on_tick(SessionState& state);

    // Re-collects and replaces the records. When nothing was found and a
    // source failed, reports "<failure_prefix>: <error>" once, until a
    // collection succeeds again. Returns false in that case.
    bool reload(SessionState& state, const std::string& failure_prefix);

    // Looks up the docker target's address into state.container_ip
    void resolve_container_ip(SessionState& state);

    void set_connections_path(std::filesystem::path path) { connections_path_ = std::move(path); }

private:
    // Normal mode
    void refresh(SessionState& state);
    void toggle_auto_refresh(SessionState& state);
    void switch_connection(SessionState& state);

    // action_dispatcher_kill.cpp
    void kill_selected(SessionState& state);

    // action_dispatcher_forward.cpp
    void submit_forward(SessionState& state);
    void quick_forward(SessionState& state);
    void launch_preset(SessionState& state);
    void add_mock_forward(SessionState& state, PortEntry entry);

    // Popups
    void dispatch_forward_popup(SessionState& state, const Action& action);
    void dispatch_presets_popup(SessionState& state, const Action& action);
    void dispatch_connections_popup(SessionState& state, const Action& action);
    void add_connection(SessionState& state);
    void delete_connection(SessionState& state);
    void save_connections();

    PortReconciler* reconciler_ = nullptr;
    IPortKiller* killer_ = nullptr;
    IForwardLauncher* forwarder_ = nullptr;
    Connections* connections_ = nullptr;
    bool mock_mode_ = false;

    std::optional<std::filesystem::path> connections_path_;
    bool no_data_reported_ = false;
};

} // namespace quay
