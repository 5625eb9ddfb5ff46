#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace quay::logging {

struct LogOptions {
    std::string level = "info";       // any spdlog level name
    bool stderr_sink = false;         // warnings and above to stderr (non-interactive commands)
    std::optional<std::filesystem::path> file;  // defaults to log_file_path()
};

// $XDG_STATE_HOME/quay/quay.log or ~/.local/state/quay/quay.log
std::optional<std::filesystem::path> log_file_path();

// Installs the default logger. Never throws: if the log file cannot be
// opened the file sink is dropped, and with no sinks left a logger that
// discards everything is installed.
void init(const LogOptions& options);

// Changes the level of the installed logger. Unknown names select info.
void set_level(const std::string& level);

} // namespace quay::logging
