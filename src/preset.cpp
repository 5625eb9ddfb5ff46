#include "preset.hpp"
#include "config.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace quay {

namespace {

std::optional<uint16_t> port_field(const nlohmann::json& item, const char* key) {
    if (!item.contains(key) || !item.at(key).is_number_unsigned()) {
        return std::nullopt;
    }
    const auto value = item.at(key).get<uint64_t>();
    if (value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

} // namespace

std::string Preset::spec() const {
    return fmt::format("{}:{}:{}", local_port, remote_host, remote_port);
}

std::optional<fs::path> Presets::presets_path() {
    auto dir = Config::config_dir();
    if (!dir) return std::nullopt;
    return *dir / "presets.json";
}

Presets Presets::from_json(const nlohmann::json& j) {
    Presets result;
    if (!j.contains("preset") || !j.at("preset").is_array()) {
        return result;
    }

    for (const auto& item : j.at("preset")) {
        if (!item.is_object()) continue;

        auto local_port = port_field(item, "local_port");
        auto remote_port = port_field(item, "remote_port");
        if (!local_port || !remote_port || !item.contains("name") || !item.contains("remote_host") ||
            !item.contains("ssh_host")) {
            spdlog::warn("skipping incomplete preset: {}", item.dump());
            continue;
        }

        Preset preset;
        preset.name = item.at("name").get<std::string>();
        if (item.contains("key") && item.at("key").is_string()) {
            preset.key = item.at("key").get<std::string>();
        }
        preset.local_port = *local_port;
        preset.remote_host = item.at("remote_host").get<std::string>();
        preset.remote_port = *remote_port;
        preset.ssh_host = item.at("ssh_host").get<std::string>();
        result.preset.push_back(std::move(preset));
    }
    return result;
}

Presets Presets::load_from(const fs::path& path) {
    auto j = read_json_file(path);
    if (!j) {
        return {};
    }

    try {
        return from_json(*j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("ignoring invalid presets file {}: {}", path.string(), e.what());
        return {};
    }
}

Presets Presets::load() {
    auto path = presets_path();
    if (!path) {
        return {};
    }
    return load_from(*path);
}

} // namespace quay
