#include "key_bindings.hpp"
#include <ncurses.h>

namespace quay {

namespace {

bool is_enter(int ch) {
    return ch == '\n' || ch == '\r' || ch == KEY_ENTER;
}

bool is_backspace(int ch) {
    return ch == KEY_BACKSPACE || ch == 127 || ch == 8;
}

} // namespace

bool is_printable_key(int ch) {
    return ch >= 32 && ch < 127;
}

std::optional<Action> map_normal_key(int ch) {
    switch (ch) {
        case 'q':
        case kKeyEscape:
        case kKeyCtrlC:
            return Action{ActionType::Quit};

        case 'j':
        case KEY_DOWN:
            return Action{ActionType::MoveDown};

        case 'k':
        case KEY_UP:
            return Action{ActionType::MoveUp};

        case 'g':
        case KEY_HOME:
            return Action{ActionType::First};

        case 'G':
        case KEY_END:
            return Action{ActionType::Last};

        case '/': return Action{ActionType::EnterSearch};
        case '?': return Action{ActionType::ShowHelp};
        case 'r': return Action{ActionType::Refresh};
        case 'a': return Action{ActionType::ToggleAutoRefresh};
        case 'f': return Action{ActionType::StartForward};
        case 'F': return Action{ActionType::QuickForward};
        case 'p': return Action{ActionType::OpenPresets};
        case 'c': return Action{ActionType::OpenConnections};
        case ']': return Action{ActionType::NextConnection};
        case '[': return Action{ActionType::PrevConnection};
        case 'K': return Action{ActionType::Kill};

        case '0':
        case '1':
        case '2':
        case '3':
            return Action{ActionType::SetFilter, ch - '0'};
    }

    if (is_enter(ch)) {
        return Action{ActionType::ShowDetails};
    }
    return std::nullopt;
}

std::optional<Action> map_search_key(int ch) {
    if (ch == kKeyEscape || is_enter(ch)) {
        return Action{ActionType::ExitSearch};
    }
    if (is_backspace(ch)) {
        return Action{ActionType::SearchBackspace};
    }
    if (is_printable_key(ch)) {
        return Action{ActionType::SearchAppend, ch};
    }
    return std::nullopt;
}

// Details and Help: any dismiss key closes
std::optional<Action> map_popup_key(int ch) {
    if (ch == kKeyEscape || ch == 'q' || is_enter(ch)) {
        return Action{ActionType::ClosePopup};
    }
    return std::nullopt;
}

std::optional<Action> map_forward_key(int ch) {
    switch (ch) {
        case kKeyEscape:
            return Action{ActionType::ClosePopup};
        case '\t':
        case KEY_DOWN:
            return Action{ActionType::NextField};
        case KEY_BTAB:
        case KEY_UP:
            return Action{ActionType::PrevField};
    }
    if (is_enter(ch)) return Action{ActionType::SubmitForward};
    if (is_backspace(ch)) return Action{ActionType::DeleteChar};
    if (is_printable_key(ch)) return Action{ActionType::InsertChar, ch};
    return std::nullopt;
}

std::optional<Action> map_presets_key(int ch) {
    switch (ch) {
        case kKeyEscape:
            return Action{ActionType::ClosePopup};
        case KEY_DOWN:
        case 'j':
            return Action{ActionType::PresetDown};
        case KEY_UP:
        case 'k':
            return Action{ActionType::PresetUp};
    }
    if (is_enter(ch)) return Action{ActionType::LaunchPreset};
    return std::nullopt;
}

std::optional<Action> map_connections_key(ConnectionPopupMode mode, int ch) {
    if (mode == ConnectionPopupMode::AddNew) {
        switch (ch) {
            case kKeyEscape:
                return Action{ActionType::CancelAddConnection};
            case '\t':
            case KEY_DOWN:
                return Action{ActionType::NextField};
            case KEY_BTAB:
            case KEY_UP:
                return Action{ActionType::PrevField};
        }
        if (is_enter(ch)) return Action{ActionType::SubmitConnection};
        if (is_backspace(ch)) return Action{ActionType::DeleteChar};
        if (is_printable_key(ch)) return Action{ActionType::InsertChar, ch};
        return std::nullopt;
    }

    switch (ch) {
        case kKeyEscape:
            return Action{ActionType::ClosePopup};
        case KEY_DOWN:
        case 'j':
            return Action{ActionType::ConnectionDown};
        case KEY_UP:
        case 'k':
            return Action{ActionType::ConnectionUp};
        case 'a':
            return Action{ActionType::AddConnection};
        case 'd':
            return Action{ActionType::DeleteConnection};
    }
    if (is_enter(ch)) return Action{ActionType::ActivateConnection};
    return std::nullopt;
}

std::optional<Action> map_key(const SessionState& state, int ch) {
    switch (state.popup) {
        case Popup::Details:
        case Popup::Help:
            return map_popup_key(ch);
        case Popup::ForwardDraft:
            return map_forward_key(ch);
        case Popup::Presets:
            return map_presets_key(ch);
        case Popup::Connections:
            return map_connections_key(state.connection_popup_mode, ch);
        case Popup::None:
            break;
    }

    if (state.input_mode == InputMode::Search) {
        return map_search_key(ch);
    }
    return map_normal_key(ch);
}

} // namespace quay
