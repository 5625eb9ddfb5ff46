#pragma once

#include "../port_entry.hpp"
#include <optional>
#include <string>
#include <vector>

namespace quay {

enum class ForwardField {
    LocalPort,
    RemoteHost,
    RemotePort,
    SshHost
};

// Cyclic cursor over the four fields, skipping locked ones. At most two
// fields can be locked, so at most two consecutive skips happen.
ForwardField next_forward_field(ForwardField field, bool ssh_host_locked, bool remote_host_locked);
ForwardField prev_forward_field(ForwardField field, bool ssh_host_locked, bool remote_host_locked);

const char* forward_field_label(ForwardField field);

struct ForwardSpec {
    std::string spec;   // "local_port:remote_host:remote_port"
    std::string host;   // ssh destination
};

// Input for creating a new SSH forward. Values stay strings while editing.
struct ForwardDraft {
    std::string local_port;
    std::string remote_host;
    std::string remote_port;
    std::string ssh_host;
    ForwardField active_field = ForwardField::LocalPort;

    // Locked fields are pre-filled and not editable
    bool ssh_host_locked = false;      // connection has a remote host
    bool remote_host_locked = false;   // connection has a docker target

    [[nodiscard]] bool is_local_port_valid() const;
    [[nodiscard]] bool is_remote_host_valid() const;
    [[nodiscard]] bool is_remote_port_valid() const;
    [[nodiscard]] bool is_ssh_host_valid() const;
    [[nodiscard]] bool is_valid() const;
    [[nodiscard]] bool is_field_valid(ForwardField field) const;

    // "Local Port", "Remote Host", ... for every failing field, in field order
    [[nodiscard]] std::vector<std::string> invalid_field_names() const;

    [[nodiscard]] bool is_locked(ForwardField field) const;
    [[nodiscard]] const std::string& value(ForwardField field) const;

    void next_field();
    void prev_field();

    // Edits apply to the active field unless it is locked
    void insert_char(char c);
    void backspace();

    [[nodiscard]] std::optional<ForwardSpec> to_spec() const;

    // Pre-filled from a record: remote port = local port, remote host
    // "localhost", ssh host from the record. Cursor starts on the SSH host
    // when the record has none.
    static ForwardDraft from_entry(const PortEntry& entry);

    // Remote session: ssh host is the session's remote host and locked.
    static ForwardDraft for_remote_entry(const PortEntry& entry, const std::string& remote_host);

    // Applies the session's locking rules. entry may be null.
    static ForwardDraft for_session(const PortEntry* entry,
                                    const std::optional<std::string>& remote_host,
                                    const std::optional<std::string>& container_ip);

private:
    std::string* mutable_value(ForwardField field);
    void settle_cursor();
};

} // namespace quay
