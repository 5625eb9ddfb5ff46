#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <fmt/format.h>
#include <algorithm>

namespace quay {

namespace {

constexpr int kTypeWidth = 8;
constexpr int kOpenWidth = 4;
constexpr int kLocalWidth = 8;
constexpr int kRemoteWidth = 24;

std::string fit(const std::string& text, int width) {
    if (width <= 0) return "";
    if (static_cast<int>(text.size()) <= width) return text;
    if (width <= 1) return text.substr(0, static_cast<size_t>(width));
    return text.substr(0, static_cast<size_t>(width - 1)) + "~";
}

} // namespace

void TuiApp::render_header() {
    int max_x = getmaxx(header_win_);

    // Row 0: title, target, counts
    wattron(header_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    mvwprintw(header_win_, 0, 1, "quay");
    wattroff(header_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    wprintw(header_win_, "  %s", target_label().c_str());
    if (state_->container_ip) {
        wprintw(header_win_, " (%s)", state_->container_ip->c_str());
    }

    std::string right = fmt::format("{} ports", state_->all_records.size());
    if (state_->mock_mode) {
        right = "[mock] " + right;
    } else if (state_->auto_refresh) {
        right = "[auto] " + right;
    }
    mvwprintw(header_win_, 0, std::max(1, max_x - static_cast<int>(right.size()) - 1), "%s", right.c_str());

    // Row 1: connections, only when there is more than the implicit Local
    if (state_->has_multiple_connections()) {
        wmove(header_win_, 1, 1);
        for (size_t i = 0; i < state_->connections.size(); ++i) {
            bool active = i == state_->active_connection_index;
            int pair = active ? COLOR_PAIR_TAB_ACTIVE : COLOR_PAIR_TAB_INACTIVE;
            wattron(header_win_, COLOR_PAIR(pair));
            wprintw(header_win_, " %s ", state_->connections[i].name.c_str());
            wattroff(header_win_, COLOR_PAIR(pair));
            waddch(header_win_, ' ');
        }
        wattron(header_win_, A_DIM);
        wprintw(header_win_, " [ ] switch");
        wattroff(header_win_, A_DIM);
    }

    // Row 2: filter tabs and the active search
    wmove(header_win_, 2, 1);
    for (int i = 0; i <= 3; ++i) {
        auto filter = static_cast<Filter>(i);
        bool active = filter == state_->filter;
        int pair = active ? COLOR_PAIR_TAB_ACTIVE : COLOR_PAIR_TAB_INACTIVE;
        wattron(header_win_, COLOR_PAIR(pair));
        wprintw(header_win_, " %d %s ", i, filter_label(filter));
        wattroff(header_win_, COLOR_PAIR(pair));
        waddch(header_win_, ' ');
    }
    if (!state_->search_query.empty()) {
        wattron(header_win_, COLOR_PAIR(COLOR_PAIR_SEARCH));
        wprintw(header_win_, " /%s ", state_->search_query.c_str());
        wattroff(header_win_, COLOR_PAIR(COLOR_PAIR_SEARCH));
    }
}

void TuiApp::render_port_table() {
    int height, width;
    getmaxyx(table_win_, height, width);
    visible_table_rows_ = std::max(1, height - 3);
    scroll_to_selection();

    draw_box_title(table_win_, fmt::format("Ports ({}/{})", state_->view.size(), state_->all_records.size()));

    int process_width = std::max(0, width - 2 - kTypeWidth - kOpenWidth - kLocalWidth - kRemoteWidth - 4);

    // Column header
    wattron(table_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);
    mvwprintw(table_win_, 1, 1, "%-*s %-*s %-*s %-*s %s",
              kTypeWidth, "TYPE", kOpenWidth, "OPEN", kLocalWidth, "LOCAL",
              kRemoteWidth, "REMOTE", "PROCESS");
    wattroff(table_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);

    if (state_->view.empty()) {
        const char* message = state_->all_records.empty() ? "No listening ports found"
                                                          : "No ports match the filter";
        int x = std::max(1, (width - static_cast<int>(std::char_traits<char>::length(message))) / 2);
        wattron(table_win_, A_DIM);
        mvwprintw(table_win_, std::min(height - 2, 3), x, "%s", message);
        wattroff(table_win_, A_DIM);
        return;
    }

    for (int row = 0; row < visible_table_rows_; ++row) {
        size_t index = static_cast<size_t>(row + table_scroll_offset_);
        if (index >= state_->view.size()) break;

        const PortEntry& entry = state_->view[index];
        bool selected = index == state_->selected_index;
        int y = row + 2;

        if (selected) {
            wattron(table_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
            mvwhline(table_win_, y, 1, ' ', width - 2);
        }

        // Per-column colors only on unselected rows
        if (!selected) wattron(table_win_, COLOR_PAIR(get_source_color(entry.source)));
        mvwprintw(table_win_, y, 1, "%-*s", kTypeWidth, source_to_string(entry.source).c_str());
        if (!selected) wattroff(table_win_, COLOR_PAIR(get_source_color(entry.source)));

        int open_pair = entry.is_open ? COLOR_PAIR_PORT_OPEN : COLOR_PAIR_PORT_CLOSED;
        if (!selected) wattron(table_win_, COLOR_PAIR(open_pair));
        mvwprintw(table_win_, y, 2 + kTypeWidth, " %s  ", entry.is_open ? "●" : "○");
        if (!selected) wattroff(table_win_, COLOR_PAIR(open_pair));

        std::string local = fmt::format(":{}", entry.local_port);
        std::string process = process_display(entry);
        if (entry.is_loopback) {
            process += " [loopback]";
        }
        mvwprintw(table_win_, y, 3 + kTypeWidth + kOpenWidth, "%-*s %-*s %s",
                  kLocalWidth, local.c_str(),
                  kRemoteWidth, fit(remote_display(entry), kRemoteWidth).c_str(),
                  fit(process, process_width).c_str());

        if (selected) {
            wattroff(table_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
        }
    }

    // Scroll indicator
    if (static_cast<int>(state_->view.size()) > visible_table_rows_) {
        std::string pos = fmt::format(" {}/{} ", state_->selected_index + 1, state_->view.size());
        mvwprintw(table_win_, height - 1, std::max(1, width - static_cast<int>(pos.size()) - 2), "%s", pos.c_str());
    }
}

void TuiApp::render_status_bar() {
    int width = getmaxx(status_win_);
    wbkgd(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));

    if (state_->status) {
        wattron(status_win_, A_BOLD);
        mvwprintw(status_win_, 0, 1, "%s", fit(state_->status->text, width - 2).c_str());
        wattroff(status_win_, A_BOLD);
        return;
    }

    struct Hint {
        const char* key;
        const char* label;
    };
    static const Hint hints[] = {
        {"q", "Quit"}, {"/", "Search"}, {"0-3", "Filter"}, {"f", "Forward"},
        {"F", "Quick"}, {"K", "Kill"}, {"p", "Presets"}, {"c", "Connections"},
        {"r", "Refresh"}, {"?", "Help"},
    };

    wmove(status_win_, 0, 1);
    for (const auto& hint : hints) {
        int x = getcurx(status_win_);
        if (x + static_cast<int>(std::char_traits<char>::length(hint.key) +
                                 std::char_traits<char>::length(hint.label)) + 3 >= width) {
            break;
        }
        wattron(status_win_, A_BOLD);
        wprintw(status_win_, "%s", hint.key);
        wattroff(status_win_, A_BOLD);
        wprintw(status_win_, ":%s  ", hint.label);
    }
}

void TuiApp::render_search_bar() {
    int width = getmaxx(status_win_);
    wbkgd(status_win_, COLOR_PAIR(COLOR_PAIR_SEARCH));
    mvwprintw(status_win_, 0, 0, "/%s", fit(state_->search_query, width - 3).c_str());
    waddch(status_win_, '_');
}

} // namespace quay
