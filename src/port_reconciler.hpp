#pragma once

#include "interfaces/i_port_collector.hpp"
#include "interfaces/i_port_prober.hpp"
#include "errors.hpp"
#include <vector>

namespace quay {

// Merges every source into one sorted, deduplicated, liveness-annotated list.
// Non-owning: all collaborators must outlive the reconciler.
class PortReconciler {
public:
    PortReconciler(IPortCollector* local,
                   IPortCollector* docker,
                   IPortCollector* ssh,
                   IContainerPortSource* container_source,
                   IPortProber* prober);

    // With a docker target, returns the container-interior listing (sorted,
    // not probed). Otherwise collects local, docker and ssh, drops local
    // duplicates, probes and sorts.
    std::vector<PortEntry> collect_all(const Target& target);

    ContainerIpResult get_container_ip(const Target& target);

    // Errors from the most recent collect_all()
    [[nodiscard]] const std::vector<SourceError>& last_errors() const { return last_errors_; }

    // Drops every Local entry whose port is also claimed by an SSH or Docker entry.
    static void dedup_local(std::vector<PortEntry>& entries);

    // Ports needing a live check. In remote mode only SSH ports are probed:
    // the remote listing is already authoritative for the rest.
    static std::vector<uint16_t> ports_to_probe(const std::vector<PortEntry>& entries, bool remote_mode);

    static void apply_probe_results(std::vector<PortEntry>& entries, const std::map<uint16_t, bool>& results);

private:
    void gather_errors(IPortCollector* collector);

    IPortCollector* local_ = nullptr;
    IPortCollector* docker_ = nullptr;
    IPortCollector* ssh_ = nullptr;
    IContainerPortSource* container_source_ = nullptr;
    IPortProber* prober_ = nullptr;

    std::vector<SourceError> last_errors_;
};

} // namespace quay
