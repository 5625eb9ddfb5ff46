#pragma once

#include "viewmodels/session_view_model.hpp"
#include <optional>

namespace quay {

enum class ActionType {
    Quit,
    MoveDown,
    MoveUp,
    First,
    Last,
    ShowDetails,
    ShowHelp,
    Refresh,
    ToggleAutoRefresh,
    EnterSearch,
    ExitSearch,
    SearchAppend,
    SearchBackspace,
    SetFilter,
    Kill,
    StartForward,
    QuickForward,
    OpenPresets,
    OpenConnections,
    NextConnection,
    PrevConnection,
    ClosePopup,

    // Text entry inside a popup
    NextField,
    PrevField,
    InsertChar,
    DeleteChar,
    SubmitForward,

    PresetDown,
    PresetUp,
    LaunchPreset,

    ConnectionDown,
    ConnectionUp,
    ActivateConnection,
    AddConnection,
    DeleteConnection,
    SubmitConnection,
    CancelAddConnection,
};

// ch carries the character for SearchAppend / InsertChar and the filter
// index (0-3) for SetFilter
struct Action {
    ActionType type;
    int ch = 0;

    bool operator==(const Action&) const = default;
};

constexpr int kKeyEscape = 27;
constexpr int kKeyCtrlC = 3;

[[nodiscard]] bool is_printable_key(int ch);

std::optional<Action> map_normal_key(int ch);
std::optional<Action> map_search_key(int ch);
std::optional<Action> map_popup_key(int ch);
std::optional<Action> map_forward_key(int ch);
std::optional<Action> map_presets_key(int ch);
std::optional<Action> map_connections_key(ConnectionPopupMode mode, int ch);

// Routes ch to the handler for the session's current mode. An open popup
// takes priority over search mode.
std::optional<Action> map_key(const SessionState& state, int ch);

} // namespace quay
