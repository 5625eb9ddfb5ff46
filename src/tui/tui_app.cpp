#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../tick_scheduler.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>

namespace quay {

// Signal handler for terminal resize
static std::atomic<bool> g_resize_requested{false};

static void handle_resize([[maybe_unused]] int sig) {
    g_resize_requested.store(true);
}

TuiApp::TuiApp(SessionState* state, ActionDispatcher* dispatcher, bool mouse_enabled)
    : state_(state)
    , dispatcher_(dispatcher)
    , mouse_enabled_(mouse_enabled)
{
    if (!state_ || !dispatcher_) {
        throw std::invalid_argument("TuiApp requires a session and a dispatcher");
    }
}

TuiApp::~TuiApp() {
    cleanup_windows();
}

void TuiApp::run() {
    // Initialize ncurses
    if (!initscr()) {
        throw std::runtime_error("failed to initialize the terminal");
    }
    raw();  // Ctrl-C arrives as a key
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    set_escdelay(25);
    timeout(kTickMs);  // getch() waits at most one tick

    if (mouse_enabled_) {
        mouseinterval(0);
        mousemask(BUTTON1_PRESSED | BUTTON1_CLICKED | BUTTON4_PRESSED | BUTTON5_PRESSED, nullptr);
    }

    init_colors();

    printf("\033]0;quay\007");
    fflush(stdout);

    signal(SIGWINCH, handle_resize);

    create_windows();

    // Show the empty frame while the first collection runs
    state_->set_status("Loading...");
    render();
    dispatcher_->start(*state_);
    if (state_->status && state_->status->text == "Loading...") {
        state_->status.reset();
    }

    TickScheduler ticks(std::chrono::milliseconds(kTickMs), TickScheduler::Clock::now());

    while (!state_->should_quit) {
        render();

        if (g_resize_requested.exchange(false)) {
            endwin();
            refresh();
            resize_windows();
        }

        int ch = getch();
        if (ch != ERR) {
            handle_input(ch);
        }

        // One tick per pass at most, so getch() is reached again after a slow reload
        if (!state_->should_quit && ticks.due(TickScheduler::Clock::now())) {
            dispatcher_->on_tick(*state_);
            ticks.complete(TickScheduler::Clock::now());
        }
    }

    cleanup_windows();
    endwin();

    // Reset terminal title
    printf("\033]0;\007");
    fflush(stdout);
}

void TuiApp::create_windows() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    int table_height = std::max(3, max_y - kHeaderHeight - kStatusBarHeight);

    header_win_ = newwin(kHeaderHeight, max_x, 0, 0);

    // Track table window position for mouse clicks
    table_win_y_ = kHeaderHeight;
    table_win_ = newwin(table_height, max_x, table_win_y_, 0);
    visible_table_rows_ = std::max(1, table_height - 3);  // border and column header

    status_win_ = newwin(kStatusBarHeight, max_x, kHeaderHeight + table_height, 0);

    keypad(header_win_, TRUE);
    keypad(table_win_, TRUE);
    keypad(status_win_, TRUE);
}

void TuiApp::resize_windows() {
    cleanup_windows();
    create_windows();
}

void TuiApp::cleanup_windows() {
    if (header_win_) {
        delwin(header_win_);
        header_win_ = nullptr;
    }
    if (table_win_) {
        delwin(table_win_);
        table_win_ = nullptr;
    }
    if (status_win_) {
        delwin(status_win_);
        status_win_ = nullptr;
    }
}

void TuiApp::render() {
    werase(header_win_);
    werase(table_win_);
    werase(status_win_);

    render_header();
    render_port_table();
    if (state_->input_mode == InputMode::Search) {
        render_search_bar();
    } else {
        render_status_bar();
    }

    wnoutrefresh(header_win_);
    wnoutrefresh(table_win_);
    wnoutrefresh(status_win_);
    doupdate();

    // Popups draw over the panels
    switch (state_->popup) {
        case Popup::Details: render_details_popup(); break;
        case Popup::Help: render_help_popup(); break;
        case Popup::ForwardDraft: render_forward_popup(); break;
        case Popup::Presets: render_presets_popup(); break;
        case Popup::Connections: render_connections_popup(); break;
        case Popup::None: break;
    }
}

void TuiApp::draw_box_title(WINDOW* win, const std::string& title) {
    wattron(win, COLOR_PAIR(COLOR_PAIR_BORDER));
    box(win, 0, 0);
    wattroff(win, COLOR_PAIR(COLOR_PAIR_BORDER));
    if (!title.empty()) {
        wattron(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
        mvwprintw(win, 0, 2, " %s ", title.c_str());
        wattroff(win, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    }
}

WINDOW* TuiApp::create_dialog(int height, int width, const std::string& title) {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    width = std::min(width, max_x);
    height = std::min(height, max_y);
    WINDOW* win = newwin(height, width, (max_y - height) / 2, (max_x - width) / 2);
    if (!win) return nullptr;

    wbkgd(win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(win, 0, 0);
    wattron(win, A_BOLD);
    mvwprintw(win, 0, std::max(1, (width - static_cast<int>(title.size()) - 2) / 2), " %s ", title.c_str());
    wattroff(win, A_BOLD);
    return win;
}

std::string TuiApp::target_label() const {
    const auto& target = state_->target;
    if (target.remote_host && target.docker_target) {
        return fmt::format("{} / docker:{}", *target.remote_host, *target.docker_target);
    }
    if (target.remote_host) {
        return *target.remote_host;
    }
    if (target.docker_target) {
        return fmt::format("docker:{}", *target.docker_target);
    }
    return "localhost";
}

} // namespace quay
