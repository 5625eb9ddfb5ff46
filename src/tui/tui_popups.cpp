#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <utility>
#include <vector>

namespace quay {

namespace {

std::string or_dash(const std::optional<std::string>& value) {
    return value ? *value : "-";
}

} // namespace

void TuiApp::draw_field(WINDOW* win, int y, int x, int width, const std::string& label,
                        const std::string& value, bool active, bool locked, bool valid) {
    mvwprintw(win, y, x, "%-12s", label.c_str());

    int field_x = x + 13;
    int field_width = std::max(4, width - 13);
    int pair = active ? COLOR_PAIR_FIELD_ACTIVE : (locked ? COLOR_PAIR_FIELD_LOCKED : COLOR_PAIR_DIALOG_BUTTON);

    wattron(win, COLOR_PAIR(pair));
    mvwhline(win, y, field_x, ' ', field_width);
    std::string shown = value;
    if (static_cast<int>(shown.size()) > field_width - 1) {
        shown = shown.substr(shown.size() - static_cast<size_t>(field_width - 1));
    }
    mvwprintw(win, y, field_x, "%s%s", shown.c_str(), active ? "_" : "");
    wattroff(win, COLOR_PAIR(pair));

    if (locked) {
        mvwprintw(win, y, field_x + field_width + 1, "locked");
    } else if (!valid) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        mvwprintw(win, y, field_x + field_width + 1, "!");
        wattroff(win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
    }
}

void TuiApp::render_details_popup() {
    const PortEntry* entry = state_->selected_record();
    if (!entry) return;

    std::vector<std::pair<std::string, std::string>> rows = {
        {"Source", source_to_string(entry->source)},
        {"Local port", std::to_string(entry->local_port)},
        {"Status", entry->is_open ? "open" : "closed"},
        {"Remote host", or_dash(entry->remote_host)},
        {"Remote port", entry->remote_port ? std::to_string(*entry->remote_port) : "-"},
        {"Process", entry->process_name.empty() ? "-" : entry->process_name},
        {"PID", entry->pid ? std::to_string(*entry->pid) : "-"},
    };
    if (entry->source == PortSource::Docker) {
        rows.emplace_back("Container", or_dash(entry->container_name));
        rows.emplace_back("Container ID", or_dash(entry->container_id));
        rows.emplace_back("Loopback", entry->is_loopback ? "yes (not forwardable)" : "no");
    }
    if (entry->source == PortSource::Ssh) {
        rows.emplace_back("SSH host", or_dash(entry->ssh_host));
    }

    int height = static_cast<int>(rows.size()) + 4;
    int width = 56;
    WINDOW* win = create_dialog(height, width, "Port Details");
    if (!win) return;

    int row = 1;
    for (const auto& [label, value] : rows) {
        wattron(win, A_BOLD);
        mvwprintw(win, row, 2, "%-14s", label.c_str());
        wattroff(win, A_BOLD);
        mvwprintw(win, row, 17, "%.*s", width - 19, value.c_str());
        ++row;
    }

    wattron(win, A_DIM);
    mvwprintw(win, height - 2, 2, "Esc/Enter/q to close");
    wattroff(win, A_DIM);

    wrefresh(win);
    delwin(win);
}

void TuiApp::render_help_popup() {
    struct HelpLine {
        const char* key;
        const char* text;
    };
    static const HelpLine lines[] = {
        {"j/Down k/Up", "Move selection"},
        {"g/Home G/End", "Jump to first/last"},
        {"Enter", "Port details"},
        {"/", "Search (process, port, remote host)"},
        {"0 1 2 3", "Filter: All / Local / SSH / Docker"},
        {"r", "Refresh now"},
        {"a", "Toggle auto-refresh"},
        {"f", "New SSH forward"},
        {"F", "Quick forward selected port"},
        {"p", "Presets"},
        {"c", "Connections"},
        {"[ ]", "Previous/next connection"},
        {"K", "Kill process / stop container"},
        {"?", "This help"},
        {"q/Esc/Ctrl-C", "Quit"},
    };

    int height = static_cast<int>(std::size(lines)) + 4;
    int width = 56;
    WINDOW* win = create_dialog(height, width, "Help");
    if (!win) return;

    int row = 1;
    for (const auto& line : lines) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_HELP_KEY) | A_BOLD);
        mvwprintw(win, row, 2, "%-14s", line.key);
        wattroff(win, COLOR_PAIR(COLOR_PAIR_HELP_KEY) | A_BOLD);
        mvwprintw(win, row, 17, "%s", line.text);
        ++row;
    }

    wattron(win, A_DIM);
    mvwprintw(win, height - 2, 2, "Esc/Enter/q to close");
    wattroff(win, A_DIM);

    wrefresh(win);
    delwin(win);
}

void TuiApp::render_forward_popup() {
    const ForwardDraft& draft = state_->forward_draft;

    int height = 11;
    int width = 60;
    WINDOW* win = create_dialog(height, width, "New SSH Forward");
    if (!win) return;

    static const ForwardField fields[] = {
        ForwardField::LocalPort, ForwardField::RemoteHost,
        ForwardField::RemotePort, ForwardField::SshHost,
    };

    int row = 2;
    for (auto field : fields) {
        draw_field(win, row++, 2, width - 12, forward_field_label(field), draft.value(field),
                   field == draft.active_field, draft.is_locked(field), draft.is_field_valid(field));
    }

    // Preview of the command that will run
    ++row;
    if (auto spec = draft.to_spec()) {
        std::string preview = fmt::format("ssh -f -N -L {} {}", spec->spec, spec->host);
        mvwprintw(win, row, 2, "%.*s", width - 4, preview.c_str());
    } else {
        wattron(win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        mvwprintw(win, row, 2, "Incomplete");
        wattroff(win, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
    }

    wattron(win, A_DIM);
    mvwprintw(win, height - 2, 2, "Tab/Up/Down: field  Enter: create  Esc: cancel");
    wattroff(win, A_DIM);

    wrefresh(win);
    delwin(win);
}

void TuiApp::render_presets_popup() {
    const auto& presets = state_->presets;

    int list_rows = std::max(1, static_cast<int>(presets.size()));
    int height = list_rows + 4;
    int width = 64;
    WINDOW* win = create_dialog(height, width, "Presets");
    if (!win) return;

    if (presets.empty()) {
        wattron(win, A_DIM);
        mvwprintw(win, 1, 2, "No presets. Add them to presets.json");
        wattroff(win, A_DIM);
    }

    for (size_t i = 0; i < presets.size(); ++i) {
        const Preset& preset = presets[i];
        std::string line = fmt::format("{:<16} {} via {}", preset.name, preset.spec(), preset.ssh_host);
        if (preset.key) {
            line = fmt::format("[{}] {}", *preset.key, line);
        }
        bool selected = i == state_->preset_selected;
        if (selected) {
            wattron(win, COLOR_PAIR(COLOR_PAIR_SELECTED));
            mvwhline(win, static_cast<int>(i) + 1, 1, ' ', width - 2);
        }
        mvwprintw(win, static_cast<int>(i) + 1, 2, "%.*s", width - 4, line.c_str());
        if (selected) {
            wattroff(win, COLOR_PAIR(COLOR_PAIR_SELECTED));
        }
    }

    wattron(win, A_DIM);
    mvwprintw(win, height - 2, 2, "Up/Down: select  Enter: launch  Esc: close");
    wattroff(win, A_DIM);

    wrefresh(win);
    delwin(win);
}

void TuiApp::render_connection_form(WINDOW* win, int width) {
    const ConnectionDraft& draft = state_->connection_draft;
    draw_field(win, 2, 2, width - 12, "Name", draft.name,
               draft.active_field == ConnectionField::Name, false, draft.is_valid());
    draw_field(win, 3, 2, width - 12, "Remote host", draft.remote_host,
               draft.active_field == ConnectionField::RemoteHost, false, true);
    draw_field(win, 4, 2, width - 12, "Docker", draft.docker_target,
               draft.active_field == ConnectionField::DockerTarget, false, true);
}

void TuiApp::render_connections_popup() {
    const auto& connections = state_->connections;
    bool adding = state_->connection_popup_mode == ConnectionPopupMode::AddNew;

    int height = adding ? 9 : static_cast<int>(connections.size()) + 4;
    int width = 64;
    WINDOW* win = create_dialog(height, width, adding ? "New Connection" : "Connections");
    if (!win) return;

    if (adding) {
        render_connection_form(win, width);
        wattron(win, A_DIM);
        mvwprintw(win, height - 2, 2, "Tab: field  Enter: save  Esc: back");
        wattroff(win, A_DIM);
        wrefresh(win);
        delwin(win);
        return;
    }

    for (size_t i = 0; i < connections.size(); ++i) {
        const Connection& conn = connections[i];
        std::string where = conn.remote_host.value_or("localhost");
        if (conn.docker_target) {
            where += " / docker:" + *conn.docker_target;
        }
        std::string line = fmt::format("{} {:<16} {}", i == state_->active_connection_index ? '*' : ' ',
                                       conn.name, where);

        bool selected = i == state_->connection_selected;
        if (selected) {
            wattron(win, COLOR_PAIR(COLOR_PAIR_SELECTED));
            mvwhline(win, static_cast<int>(i) + 1, 1, ' ', width - 2);
        }
        mvwprintw(win, static_cast<int>(i) + 1, 2, "%.*s", width - 4, line.c_str());
        if (selected) {
            wattroff(win, COLOR_PAIR(COLOR_PAIR_SELECTED));
        }
    }

    wattron(win, A_DIM);
    mvwprintw(win, height - 2, 2, "Enter: switch  a: add  d: delete  Esc: close");
    wattroff(win, A_DIM);

    wrefresh(win);
    delwin(win);
}

} // namespace quay
