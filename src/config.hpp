#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace quay {

struct GeneralConfig {
    bool auto_refresh = false;
    uint32_t refresh_interval = 5;           // seconds
    std::string default_filter = "all";      // all | local | ssh | docker
    std::optional<std::string> remote_host;
    std::optional<std::string> docker_target;
    std::string log_level = "info";
};

struct UiConfig {
    bool mouse_enabled = false;
};

struct Config {
    GeneralConfig general;
    UiConfig ui;

    // $XDG_CONFIG_HOME/quay or ~/.config/quay
    static std::optional<std::filesystem::path> config_dir();
    static std::optional<std::filesystem::path> config_path();

    // Missing file or malformed content yields the defaults.
    static Config load();
    static Config load_from(const std::filesystem::path& path);

    // Missing keys keep their defaults. Throws nlohmann::json::exception on
    // keys with the wrong type.
    static Config from_json(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json to_json() const;

    // Ticks are 250 ms: refresh_interval * 4, at least 1.
    [[nodiscard]] uint32_t refresh_ticks() const;
};

// Reads a JSON document; nullopt if the file is absent or unparsable.
std::optional<nlohmann::json> read_json_file(const std::filesystem::path& path);

// Writes pretty JSON, creating parent directories. False on any I/O error.
bool write_json_file(const std::filesystem::path& path, const nlohmann::json& j);

} // namespace quay
