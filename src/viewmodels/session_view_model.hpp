#pragma once

#include "../port_entry.hpp"
#include "../connection.hpp"
#include "../preset.hpp"
#include "forward_draft_view_model.hpp"
#include "connection_draft_view_model.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace quay {

enum class Filter {
    All,
    Local,
    Ssh,
    Docker
};

enum class InputMode {
    Normal,
    Search
};

// Mutually exclusive overlays
enum class Popup {
    None,
    Details,
    Help,
    ForwardDraft,
    Presets,
    Connections
};

struct StatusMessage {
    std::string text;
    uint32_t ticks_remaining = 0;
};

const char* filter_label(Filter filter);

// "all" / "local" / "ssh" / "docker"; anything else is All
Filter filter_from_string(const std::string& text);

// The live state of one interactive run. Owned by the event loop and
// mutated only on that thread.
struct SessionState {
    // Record set, as produced by the reconciler
    std::vector<PortEntry> all_records;

    // Filter + search projection of all_records. Recomputed, never edited.
    std::vector<PortEntry> view;
    size_t selected_index = 0;

    Filter filter = Filter::All;
    std::string search_query;
    InputMode input_mode = InputMode::Normal;
    Popup popup = Popup::None;

    ForwardDraft forward_draft;

    // Presets popup
    std::vector<Preset> presets;
    size_t preset_selected = 0;

    // Connections: index 0 is always the implicit "Local" entry
    std::vector<Connection> connections{Connection::local()};
    size_t active_connection_index = 0;
    size_t connection_selected = 0;
    ConnectionPopupMode connection_popup_mode = ConnectionPopupMode::List;
    ConnectionDraft connection_draft;

    // Currently applied target, and the docker target's resolved address
    Target target;
    std::optional<std::string> container_ip;

    std::optional<StatusMessage> status;
    uint32_t tick_count = 0;
    bool auto_refresh = false;
    uint32_t refresh_period_ticks = 20;

    bool mock_mode = false;
    bool should_quit = false;

    static constexpr uint32_t kStatusTicks = 12;  // ~3 s at 250 ms per tick

    [[nodiscard]] bool is_remote() const { return target.is_remote(); }
    [[nodiscard]] bool is_docker_target() const { return target.is_docker(); }

    // Replaces all_records and recomputes the view
    void set_records(std::vector<PortEntry> records);
    void apply_filter();
    void set_filter(Filter new_filter);
    [[nodiscard]] bool matches(const PortEntry& entry) const;

    [[nodiscard]] const PortEntry* selected_record() const;
    void next();
    void previous();
    void first();
    void last();
    void select_row(size_t row);

    void set_status(const std::string& message);

    // Advances the tick counter and ages the status message
    void tick();
    [[nodiscard]] bool should_refresh() const;

    void preset_next();
    void preset_previous();
    [[nodiscard]] const Preset* selected_preset() const;

    [[nodiscard]] bool has_multiple_connections() const { return connections.size() > 1; }
    [[nodiscard]] const Connection* active_connection() const;
    void next_connection();
    void prev_connection();
    // Applies the active connection's remote host and docker target.
    // Clears the cached container IP.
    void apply_connection();

    // Cursor inside the connections popup
    void connection_next();
    void connection_previous();

    void open_forward_draft();
    void close_popup();
    void reset_forward_draft() { forward_draft = ForwardDraft{}; }
    void reset_connection_draft() { connection_draft = ConnectionDraft{}; }
};

} // namespace quay
