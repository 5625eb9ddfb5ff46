#include "forward_draft_view_model.hpp"
#include "../shell_command.hpp"
#include <fmt/format.h>

namespace quay {

namespace {

ForwardField step_forward(ForwardField field) {
    switch (field) {
        case ForwardField::LocalPort: return ForwardField::RemoteHost;
        case ForwardField::RemoteHost: return ForwardField::RemotePort;
        case ForwardField::RemotePort: return ForwardField::SshHost;
        case ForwardField::SshHost: return ForwardField::LocalPort;
    }
    return ForwardField::LocalPort;
}

ForwardField step_back(ForwardField field) {
    switch (field) {
        case ForwardField::LocalPort: return ForwardField::SshHost;
        case ForwardField::RemoteHost: return ForwardField::LocalPort;
        case ForwardField::RemotePort: return ForwardField::RemoteHost;
        case ForwardField::SshHost: return ForwardField::RemotePort;
    }
    return ForwardField::LocalPort;
}

bool field_locked(ForwardField field, bool ssh_host_locked, bool remote_host_locked) {
    return (field == ForwardField::SshHost && ssh_host_locked) ||
           (field == ForwardField::RemoteHost && remote_host_locked);
}

} // namespace

ForwardField next_forward_field(ForwardField field, bool ssh_host_locked, bool remote_host_locked) {
    ForwardField next = step_forward(field);
    for (int skips = 0; skips < 2 && field_locked(next, ssh_host_locked, remote_host_locked); ++skips) {
        next = step_forward(next);
    }
    return next;
}

ForwardField prev_forward_field(ForwardField field, bool ssh_host_locked, bool remote_host_locked) {
    ForwardField prev = step_back(field);
    for (int skips = 0; skips < 2 && field_locked(prev, ssh_host_locked, remote_host_locked); ++skips) {
        prev = step_back(prev);
    }
    return prev;
}

const char* forward_field_label(ForwardField field) {
    switch (field) {
        case ForwardField::LocalPort: return "Local Port";
        case ForwardField::RemoteHost: return "Remote Host";
        case ForwardField::RemotePort: return "Remote Port";
        case ForwardField::SshHost: return "SSH Host";
    }
    return "";
}

bool ForwardDraft::is_local_port_valid() const {
    return parse_port(local_port).has_value();
}

bool ForwardDraft::is_remote_host_valid() const {
    return !trim(remote_host).empty();
}

bool ForwardDraft::is_remote_port_valid() const {
    return parse_port(remote_port).has_value();
}

bool ForwardDraft::is_ssh_host_valid() const {
    return !trim(ssh_host).empty();
}

bool ForwardDraft::is_valid() const {
    return is_local_port_valid() && is_remote_host_valid() && is_remote_port_valid() && is_ssh_host_valid();
}

bool ForwardDraft::is_field_valid(ForwardField field) const {
    switch (field) {
        case ForwardField::LocalPort: return is_local_port_valid();
        case ForwardField::RemoteHost: return is_remote_host_valid();
        case ForwardField::RemotePort: return is_remote_port_valid();
        case ForwardField::SshHost: return is_ssh_host_valid();
    }
    return false;
}

std::vector<std::string> ForwardDraft::invalid_field_names() const {
    std::vector<std::string> names;
    for (auto field : {ForwardField::LocalPort, ForwardField::RemoteHost,
                       ForwardField::RemotePort, ForwardField::SshHost}) {
        if (!is_field_valid(field)) {
            names.emplace_back(forward_field_label(field));
        }
    }
    return names;
}

bool ForwardDraft::is_locked(ForwardField field) const {
    return field_locked(field, ssh_host_locked, remote_host_locked);
}

const std::string& ForwardDraft::value(ForwardField field) const {
    switch (field) {
        case ForwardField::LocalPort: return local_port;
        case ForwardField::RemoteHost: return remote_host;
        case ForwardField::RemotePort: return remote_port;
        case ForwardField::SshHost: return ssh_host;
    }
    return local_port;
}

std::string* ForwardDraft::mutable_value(ForwardField field) {
    if (is_locked(field)) {
        return nullptr;
    }
    switch (field) {
        case ForwardField::LocalPort: return &local_port;
        case ForwardField::RemoteHost: return &remote_host;
        case ForwardField::RemotePort: return &remote_port;
        case ForwardField::SshHost: return &ssh_host;
    }
    return nullptr;
}

void ForwardDraft::next_field() {
    active_field = next_forward_field(active_field, ssh_host_locked, remote_host_locked);
}

void ForwardDraft::prev_field() {
    active_field = prev_forward_field(active_field, ssh_host_locked, remote_host_locked);
}

void ForwardDraft::settle_cursor() {
    if (is_locked(active_field)) {
        next_field();
    }
}

void ForwardDraft::insert_char(char c) {
    if (auto* target = mutable_value(active_field)) {
        target->push_back(c);
    }
}

void ForwardDraft::backspace() {
    if (auto* target = mutable_value(active_field); target && !target->empty()) {
        target->pop_back();
    }
}

std::optional<ForwardSpec> ForwardDraft::to_spec() const {
    if (!is_valid()) {
        return std::nullopt;
    }
    const auto lp = parse_port(local_port);
    const auto rp = parse_port(remote_port);
    return ForwardSpec{fmt::format("{}:{}:{}", *lp, trim(remote_host), *rp), trim(ssh_host)};
}

ForwardDraft ForwardDraft::from_entry(const PortEntry& entry) {
    ForwardDraft draft;
    draft.local_port = std::to_string(entry.local_port);
    draft.remote_host = "localhost";
    draft.remote_port = std::to_string(entry.local_port);
    draft.ssh_host = entry.ssh_host.value_or("");
    draft.active_field = draft.ssh_host.empty() ? ForwardField::SshHost : ForwardField::LocalPort;
    return draft;
}

ForwardDraft ForwardDraft::for_remote_entry(const PortEntry& entry, const std::string& remote_host) {
    ForwardDraft draft;
    draft.local_port = std::to_string(entry.local_port);
    draft.remote_host = "localhost";
    draft.remote_port = std::to_string(entry.local_port);
    draft.ssh_host = remote_host;
    draft.ssh_host_locked = true;
    draft.active_field = ForwardField::LocalPort;
    return draft;
}

ForwardDraft ForwardDraft::for_session(const PortEntry* entry,
                                       const std::optional<std::string>& remote_host,
                                       const std::optional<std::string>& container_ip) {
    ForwardDraft draft;
    if (entry && remote_host) {
        draft = for_remote_entry(*entry, *remote_host);
    } else if (entry) {
        draft = from_entry(*entry);
    } else if (remote_host) {
        draft.ssh_host = *remote_host;
        draft.ssh_host_locked = true;
    }

    // Docker target: forwards go to the container's private address
    if (container_ip) {
        draft.remote_host = *container_ip;
        draft.remote_host_locked = true;
    }

    draft.settle_cursor();
    return draft;
}

} // namespace quay
