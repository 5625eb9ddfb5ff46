#include "mock_data.hpp"

namespace quay {

namespace {

PortEntry local_entry(uint16_t port, const char* name, int pid, bool open) {
    PortEntry e;
    e.source = PortSource::Local;
    e.local_port = port;
    e.process_name = name;
    e.pid = pid;
    e.is_open = open;
    return e;
}

PortEntry docker_entry(uint16_t port, const char* image, const char* id, const char* name, bool open) {
    PortEntry e;
    e.source = PortSource::Docker;
    e.local_port = port;
    e.remote_port = port;
    e.process_name = image;
    e.container_id = id;
    e.container_name = name;
    e.is_open = open;
    return e;
}

} // namespace

std::vector<PortEntry> make_mock_entries() {
    std::vector<PortEntry> entries;

    entries.push_back(local_entry(3000, "node", 1234, true));
    entries.push_back(local_entry(8080, "python", 2345, true));
    entries.push_back(local_entry(4200, "ng", 3456, false));

    PortEntry tunnel;
    tunnel.source = PortSource::Ssh;
    tunnel.local_port = 9000;
    tunnel.remote_host = "db.internal";
    tunnel.remote_port = 5432;
    tunnel.process_name = "ssh";
    tunnel.pid = 4567;
    tunnel.ssh_host = "bastion";
    tunnel.is_open = true;
    entries.push_back(tunnel);

    PortEntry reverse;
    reverse.source = PortSource::Ssh;
    reverse.local_port = 9090;
    reverse.remote_host = "(R) localhost:9090";
    reverse.remote_port = 9090;
    reverse.process_name = "ssh -R";
    reverse.pid = 5678;
    reverse.ssh_host = "bastion";
    reverse.is_open = false;
    entries.push_back(reverse);

    entries.push_back(docker_entry(5432, "postgres:15", "abc123def456", "postgres", true));
    entries.push_back(docker_entry(6379, "redis:7", "def456abc789", "redis", true));
    entries.push_back(docker_entry(27017, "mongo:6", "789abc123def", "mongo", false));

    sort_entries(entries);
    return entries;
}

PortEntry make_mock_forward_entry(uint16_t local_port, const std::string& remote_host,
                                  std::optional<uint16_t> remote_port, const std::string& ssh_host) {
    PortEntry e;
    e.source = PortSource::Ssh;
    e.local_port = local_port;
    e.remote_host = remote_host;
    e.remote_port = remote_port;
    e.process_name = "ssh";
    e.pid = kMockForwardPid;
    e.ssh_host = ssh_host;
    e.is_open = true;
    return e;
}

} // namespace quay
