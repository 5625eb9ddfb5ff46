#pragma once

#include "../connection.hpp"
#include "../shell_command.hpp"
#include <optional>
#include <string>

namespace quay {

enum class ConnectionField {
    Name,
    RemoteHost,
    DockerTarget
};

enum class ConnectionPopupMode {
    List,
    AddNew
};

// Input for bookmarking a new connection. Only the name is required.
struct ConnectionDraft {
    std::string name;
    std::string remote_host;
    std::string docker_target;
    ConnectionField active_field = ConnectionField::Name;

    void next_field() {
        switch (active_field) {
            case ConnectionField::Name: active_field = ConnectionField::RemoteHost; break;
            case ConnectionField::RemoteHost: active_field = ConnectionField::DockerTarget; break;
            case ConnectionField::DockerTarget: active_field = ConnectionField::Name; break;
        }
    }

    void prev_field() {
        switch (active_field) {
            case ConnectionField::Name: active_field = ConnectionField::DockerTarget; break;
            case ConnectionField::RemoteHost: active_field = ConnectionField::Name; break;
            case ConnectionField::DockerTarget: active_field = ConnectionField::RemoteHost; break;
        }
    }

    std::string& active_value() {
        switch (active_field) {
            case ConnectionField::RemoteHost: return remote_host;
            case ConnectionField::DockerTarget: return docker_target;
            case ConnectionField::Name: break;
        }
        return name;
    }

    [[nodiscard]] bool is_valid() const { return !trim(name).empty(); }

    // Blank optional fields become nullopt
    [[nodiscard]] std::optional<Connection> to_connection() const {
        if (!is_valid()) return std::nullopt;

        Connection conn;
        conn.name = trim(name);
        if (auto host = trim(remote_host); !host.empty()) conn.remote_host = host;
        if (auto target = trim(docker_target); !target.empty()) conn.docker_target = target;
        return conn;
    }
};

} // namespace quay
