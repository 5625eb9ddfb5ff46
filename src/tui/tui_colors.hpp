#pragma once

#include "../port_entry.hpp"
#include <ncurses.h>

namespace quay {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_TITLE,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_HEADER,
    COLOR_PAIR_BORDER,
    COLOR_PAIR_STATUS,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_WARNING,
    COLOR_PAIR_PORT_OPEN,
    COLOR_PAIR_PORT_CLOSED,
    COLOR_PAIR_SOURCE_LOCAL,
    COLOR_PAIR_SOURCE_SSH,
    COLOR_PAIR_SOURCE_DOCKER,
    COLOR_PAIR_TAB_ACTIVE,
    COLOR_PAIR_TAB_INACTIVE,
    COLOR_PAIR_SEARCH,
    COLOR_PAIR_DIALOG,
    COLOR_PAIR_DIALOG_BUTTON,
    COLOR_PAIR_HELP_KEY,
    COLOR_PAIR_FIELD_ACTIVE,
    COLOR_PAIR_FIELD_LOCKED,
};

// Initialize ncurses color pairs
void init_colors();

// Get color pair for a port's source
int get_source_color(PortSource source);

} // namespace quay
