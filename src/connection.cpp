#include "connection.hpp"
#include "config.hpp"
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace quay {

Connection Connection::local() {
    return {"Local", std::nullopt, std::nullopt};
}

std::optional<fs::path> Connections::connections_path() {
    auto dir = Config::config_dir();
    if (!dir) return std::nullopt;
    return *dir / "connections.json";
}

Connections Connections::from_json(const nlohmann::json& j) {
    Connections result;
    if (!j.contains("connection") || !j.at("connection").is_array()) {
        return result;
    }

    for (const auto& item : j.at("connection")) {
        if (!item.is_object() || !item.contains("name")) continue;

        Connection conn;
        conn.name = item.at("name").get<std::string>();
        if (item.contains("remote_host") && item.at("remote_host").is_string()) {
            conn.remote_host = item.at("remote_host").get<std::string>();
        }
        if (item.contains("docker_target") && item.at("docker_target").is_string()) {
            conn.docker_target = item.at("docker_target").get<std::string>();
        }
        result.connection.push_back(std::move(conn));
    }
    return result;
}

nlohmann::json Connections::to_json() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& conn : connection) {
        nlohmann::json item = {{"name", conn.name}};
        if (conn.remote_host) item["remote_host"] = *conn.remote_host;
        if (conn.docker_target) item["docker_target"] = *conn.docker_target;
        list.push_back(std::move(item));
    }
    return {{"connection", list}};
}

Connections Connections::load_from(const fs::path& path) {
    auto j = read_json_file(path);
    if (!j) {
        return {};
    }

    try {
        return from_json(*j);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("ignoring invalid connections file {}: {}", path.string(), e.what());
        return {};
    }
}

Connections Connections::load() {
    auto path = connections_path();
    if (!path) {
        return {};
    }
    return load_from(*path);
}

bool Connections::save_to(const fs::path& path) const {
    return write_json_file(path, to_json());
}

bool Connections::save() const {
    auto path = connections_path();
    if (!path) {
        spdlog::warn("could not determine config directory");
        return false;
    }
    return save_to(*path);
}

std::vector<Connection> Connections::all_with_local() const {
    std::vector<Connection> result{Connection::local()};
    result.insert(result.end(), connection.begin(), connection.end());
    return result;
}

void Connections::add(Connection conn) {
    connection.push_back(std::move(conn));
}

bool Connections::remove(size_t index) {
    if (index >= connection.size()) {
        return false;
    }
    connection.erase(connection.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

} // namespace quay
