#include "config.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>

namespace fs = std::filesystem;

namespace quay {

namespace {

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    auto value = j.at(key).get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<fs::path> Config::config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "quay";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".config" / "quay";
    }
    return std::nullopt;
}

std::optional<fs::path> Config::config_path() {
    auto dir = config_dir();
    if (!dir) return std::nullopt;
    return *dir / "config.json";
}

std::optional<nlohmann::json> read_json_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file) {
        spdlog::warn("cannot open {}", path.string());
        return std::nullopt;
    }

    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("ignoring malformed {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

bool write_json_file(const fs::path& path, const nlohmann::json& j) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::warn("cannot create {}: {}", path.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        spdlog::warn("cannot write {}", path.string());
        return false;
    }
    file << j.dump(2) << '\n';
    return static_cast<bool>(file);
}

Config Config::from_json(const nlohmann::json& j) {
    Config config;

    if (j.contains("general") && j.at("general").is_object()) {
        const auto& g = j.at("general");
        config.general.auto_refresh = g.value("auto_refresh", config.general.auto_refresh);
        config.general.refresh_interval = g.value("refresh_interval", config.general.refresh_interval);
        config.general.default_filter = g.value("default_filter", config.general.default_filter);
        config.general.remote_host = optional_string(g, "remote_host");
        config.general.docker_target = optional_string(g, "docker_target");
        config.general.log_level = g.value("log_level", config.general.log_level);
    }

    if (j.contains("ui") && j.at("ui").is_object()) {
        config.ui.mouse_enabled = j.at("ui").value("mouse_enabled", config.ui.mouse_enabled);
    }

    return config;
}

nlohmann::json Config::to_json() const {
    nlohmann::json g = {
        {"auto_refresh", general.auto_refresh},
        {"refresh_interval", general.refresh_interval},
        {"default_filter", general.default_filter},
        {"log_level", general.log_level},
    };
    g["remote_host"] = general.remote_host ? nlohmann::json(*general.remote_host) : nlohmann::json(nullptr);
    g["docker_target"] = general.docker_target ? nlohmann::json(*general.docker_target) : nlohmann::json(nullptr);

    return {
        {"general", g},
        {"ui", {{"mouse_enabled", ui.mouse_enabled}}},
    };
}

Config Config::load_from(const fs::path& path) {
    auto j = read_json_file(path);
    if (!j) {
        return {};
    }

    try {
        return from_json(*j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("ignoring invalid config {}: {}", path.string(), e.what());
        return {};
    }
}

Config Config::load() {
    auto path = config_path();
    if (!path) {
        return {};
    }
    return load_from(*path);
}

uint32_t Config::refresh_ticks() const {
    const uint64_t ticks = static_cast<uint64_t>(general.refresh_interval) * 4;
    if (ticks == 0) return 1;
    if (ticks > UINT32_MAX) return UINT32_MAX;
    return static_cast<uint32_t>(ticks);
}

} // namespace quay
