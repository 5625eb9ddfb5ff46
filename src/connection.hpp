#pragma once

#include "port_entry.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace quay {

// A bookmarked session: where to look for ports.
struct Connection {
    std::string name;
    std::optional<std::string> remote_host;
    std::optional<std::string> docker_target;

    static Connection local();
    [[nodiscard]] Target target() const { return {remote_host, docker_target}; }

    bool operator==(const Connection&) const = default;
};

// connections.json: {"connection": [{"name", "remote_host"?, "docker_target"?}]}
struct Connections {
    std::vector<Connection> connection;

    static std::optional<std::filesystem::path> connections_path();
    static Connections load();
    static Connections load_from(const std::filesystem::path& path);
    static Connections from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;
    bool save() const;
    bool save_to(const std::filesystem::path& path) const;

    // The implicit "Local" entry followed by the saved ones
    [[nodiscard]] std::vector<Connection> all_with_local() const;

    void add(Connection conn);
    bool remove(size_t index);
};

} // namespace quay
