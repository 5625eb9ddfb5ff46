#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace quay {

// A saved forward, launched from the presets popup.
struct Preset {
    std::string name;
    std::optional<std::string> key;
    uint16_t local_port = 0;
    std::string remote_host;
    uint16_t remote_port = 0;
    std::string ssh_host;

    // "local_port:remote_host:remote_port"
    [[nodiscard]] std::string spec() const;
};

// presets.json: {"preset": [{...}]}. Entries missing a required field are skipped.
struct Presets {
    std::vector<Preset> preset;

    static std::optional<std::filesystem::path> presets_path();
    static Presets load();
    static Presets load_from(const std::filesystem::path& path);
    static Presets from_json(const nlohmann::json& j);
};

} // namespace quay
