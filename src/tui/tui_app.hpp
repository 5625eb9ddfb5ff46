#pragma once

#include "../action_dispatcher.hpp"
#include "../viewmodels/session_view_model.hpp"
#include <string>
#include <ncurses.h>

namespace quay {

class TuiApp {
public:
    // Non-owning constructor: TuiApp drives but does not own the session or
    // the dispatcher. Both must outlive the TuiApp instance.
    TuiApp(SessionState* state, ActionDispatcher* dispatcher, bool mouse_enabled);
    ~TuiApp();

    // Sets up the terminal, performs the initial load and runs the event
    // loop until the session asks to quit
    void run();

private:
    // Rendering
    void render();
    void render_header();
    void render_port_table();
    void render_status_bar();
    void render_search_bar();

    // Popups (tui_popups.cpp)
    void render_details_popup();
    void render_help_popup();
    void render_forward_popup();
    void render_presets_popup();
    void render_connections_popup();
    void render_connection_form(WINDOW* win, int width);

    // Input handling
    void handle_input(int ch);
    void handle_mouse_event();
    void scroll_to_selection();

    // Window management
    void create_windows();
    void resize_windows();
    void cleanup_windows();

    // Utility
    static WINDOW* create_dialog(int height, int width, const std::string& title);
    void draw_box_title(WINDOW* win, const std::string& title);
    static void draw_field(WINDOW* win, int y, int x, int width, const std::string& label,
                           const std::string& value, bool active, bool locked, bool valid);
    [[nodiscard]] std::string target_label() const;

    // Non-owned
    SessionState* state_ = nullptr;
    ActionDispatcher* dispatcher_ = nullptr;
    bool mouse_enabled_ = false;

    // ncurses windows
    WINDOW* header_win_ = nullptr;
    WINDOW* table_win_ = nullptr;
    WINDOW* status_win_ = nullptr;

    // Scroll positions
    int table_scroll_offset_ = 0;
    int visible_table_rows_ = 0;
    int table_win_y_ = 0;

    // Layout constants
    static constexpr int kHeaderHeight = 3;
    static constexpr int kStatusBarHeight = 1;
    static constexpr int kTickMs = 250;
};

} // namespace quay
