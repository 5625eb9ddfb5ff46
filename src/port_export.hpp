#pragma once

#include "port_entry.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace quay {

// Keeps only entries from source; everything when source is unset.
std::vector<PortEntry> filter_by_source(const std::vector<PortEntry>& entries,
                                        std::optional<PortSource> source);

// One object per entry. Optional fields are null when absent.
nlohmann::json entry_to_json(const PortEntry& entry);
nlohmann::json entries_to_json(const std::vector<PortEntry>& entries);

// Plain-text listing: header, rule, then one row per entry
// ("TYPE OPEN LOCAL REMOTE PROCESS", open shown as a filled circle).
std::string format_table(const std::vector<PortEntry>& entries);

} // namespace quay
