#include "port_reconciler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace quay {

PortReconciler::PortReconciler(IPortCollector* local,
                               IPortCollector* docker,
                               IPortCollector* ssh,
                               IContainerPortSource* container_source,
                               IPortProber* prober)
    : local_(local)
    , docker_(docker)
    , ssh_(ssh)
    , container_source_(container_source)
    , prober_(prober)
{
}

void PortReconciler::gather_errors(IPortCollector* collector) {
    auto errors = collector->get_recent_errors();
    last_errors_.insert(last_errors_.end(), errors.begin(), errors.end());
    collector->clear_errors();
}

std::vector<PortEntry> PortReconciler::collect_all(const Target& target) {
    last_errors_.clear();

    if (target.docker_target) {
        docker_->clear_errors();
        auto entries = container_source_->collect_container(*target.docker_target, target.remote_host);
        gather_errors(docker_);
        sort_entries(entries);
        return entries;
    }

    local_->clear_errors();
    docker_->clear_errors();
    ssh_->clear_errors();

    std::vector<PortEntry> entries = local_->collect(target.remote_host);
    auto docker_entries = docker_->collect(target.remote_host);
    // Tunnel clients run on this machine even when looking at a remote host
    auto ssh_entries = ssh_->collect(std::nullopt);

    entries.insert(entries.end(), docker_entries.begin(), docker_entries.end());
    entries.insert(entries.end(), ssh_entries.begin(), ssh_entries.end());

    gather_errors(local_);
    gather_errors(docker_);
    gather_errors(ssh_);

    dedup_local(entries);

    auto ports = ports_to_probe(entries, target.is_remote());
    if (!ports.empty()) {
        apply_probe_results(entries, prober_->probe(ports));
    }

    sort_entries(entries);
    spdlog::debug("reconciled {} entries ({} probed, {} source errors)",
                  entries.size(), ports.size(), last_errors_.size());
    return entries;
}

ContainerIpResult PortReconciler::get_container_ip(const Target& target) {
    if (!target.docker_target) {
        return {std::nullopt, "No docker target"};
    }
    return container_source_->get_container_ip(*target.docker_target, target.remote_host);
}

void PortReconciler::dedup_local(std::vector<PortEntry>& entries) {
    std::set<uint16_t> claimed;
    for (const auto& entry : entries) {
        if (entry.source != PortSource::Local) {
            claimed.insert(entry.local_port);
        }
    }

    std::erase_if(entries, [&claimed](const PortEntry& entry) {
        return entry.source == PortSource::Local && claimed.contains(entry.local_port);
    });
}

std::vector<uint16_t> PortReconciler::ports_to_probe(const std::vector<PortEntry>& entries, bool remote_mode) {
    std::set<uint16_t> ports;
    for (const auto& entry : entries) {
        if (!remote_mode || entry.source == PortSource::Ssh) {
            ports.insert(entry.local_port);
        }
    }
    return {ports.begin(), ports.end()};
}

void PortReconciler::apply_probe_results(std::vector<PortEntry>& entries,
                                         const std::map<uint16_t, bool>& results) {
    for (auto& entry : entries) {
        if (auto it = results.find(entry.local_port); it != results.end()) {
            entry.is_open = it->second;
        }
    }
}

} // namespace quay
