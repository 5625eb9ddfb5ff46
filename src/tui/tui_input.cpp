#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>

namespace quay {

void TuiApp::handle_input(int ch) {
    switch (ch) {
        case KEY_RESIZE:
            resize_windows();
            return;

        case KEY_MOUSE:
            handle_mouse_event();
            return;
    }

    dispatcher_->handle_key(*state_, ch);
    scroll_to_selection();
}

void TuiApp::handle_mouse_event() {
    MEVENT event;
    if (getmouse(&event) != OK) {
        return;
    }

    // Only the table reacts, and only without a popup or search
    if (!mouse_enabled_ || state_->popup != Popup::None || state_->input_mode != InputMode::Normal) {
        return;
    }

    if (event.bstate & BUTTON4_PRESSED) {
        state_->previous();
        scroll_to_selection();
        return;
    }

    if (event.bstate & BUTTON5_PRESSED) {
        state_->next();
        scroll_to_selection();
        return;
    }

    if (event.bstate & (BUTTON1_PRESSED | BUTTON1_CLICKED)) {
        // Row 0 is the border, row 1 the column header
        int row = event.y - table_win_y_ - 2;
        if (row >= 0 && row < visible_table_rows_) {
            state_->select_row(static_cast<size_t>(row + table_scroll_offset_));
        }
    }
}

void TuiApp::scroll_to_selection() {
    int selected = static_cast<int>(state_->selected_index);
    if (selected < table_scroll_offset_) {
        table_scroll_offset_ = selected;
    } else if (selected >= table_scroll_offset_ + visible_table_rows_) {
        table_scroll_offset_ = selected - visible_table_rows_ + 1;
    }

    int max_offset = std::max(0, static_cast<int>(state_->view.size()) - visible_table_rows_);
    table_scroll_offset_ = std::clamp(table_scroll_offset_, 0, max_offset);
}

} // namespace quay
