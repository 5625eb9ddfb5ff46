#include "tui_colors.hpp"

namespace quay {

namespace {

struct PairDef {
    ColorPair pair;
    short fg;
    short bg;
};

// -1 keeps the terminal's own color
constexpr PairDef kPairs[] = {
    {COLOR_PAIR_DEFAULT, -1, -1},
    {COLOR_PAIR_TITLE, COLOR_CYAN, -1},
    {COLOR_PAIR_SELECTED, COLOR_BLACK, COLOR_CYAN},
    {COLOR_PAIR_HEADER, COLOR_YELLOW, -1},
    {COLOR_PAIR_BORDER, COLOR_BLUE, -1},
    {COLOR_PAIR_STATUS, COLOR_WHITE, COLOR_BLUE},
    {COLOR_PAIR_ERROR, COLOR_RED, -1},
    {COLOR_PAIR_WARNING, COLOR_YELLOW, -1},
    {COLOR_PAIR_PORT_OPEN, COLOR_GREEN, -1},
    {COLOR_PAIR_PORT_CLOSED, COLOR_RED, -1},
    {COLOR_PAIR_SOURCE_LOCAL, COLOR_GREEN, -1},
    {COLOR_PAIR_SOURCE_SSH, COLOR_CYAN, -1},
    {COLOR_PAIR_SOURCE_DOCKER, COLOR_BLUE, -1},
    {COLOR_PAIR_TAB_ACTIVE, COLOR_BLACK, COLOR_WHITE},
    {COLOR_PAIR_TAB_INACTIVE, COLOR_WHITE, -1},
    {COLOR_PAIR_SEARCH, COLOR_BLACK, COLOR_YELLOW},
    {COLOR_PAIR_DIALOG, COLOR_WHITE, COLOR_BLUE},
    {COLOR_PAIR_DIALOG_BUTTON, COLOR_BLACK, COLOR_WHITE},
    {COLOR_PAIR_HELP_KEY, COLOR_CYAN, COLOR_BLUE},
    {COLOR_PAIR_FIELD_ACTIVE, COLOR_BLACK, COLOR_YELLOW},
    {COLOR_PAIR_FIELD_LOCKED, COLOR_BLACK, COLOR_BLUE},
};

} // namespace

void init_colors() {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    for (const auto& def : kPairs) {
        init_pair(def.pair, def.fg, def.bg);
    }
}

int get_source_color(PortSource source) {
    switch (source) {
        case PortSource::Local:
            return COLOR_PAIR_SOURCE_LOCAL;
        case PortSource::Ssh:
            return COLOR_PAIR_SOURCE_SSH;
        case PortSource::Docker:
            return COLOR_PAIR_SOURCE_DOCKER;
    }
    return COLOR_PAIR_DEFAULT;
}

} // namespace quay
