#pragma once

#include "../interfaces/i_port_collector.hpp"
#include "../interfaces/i_command_runner.hpp"
#include <chrono>
#include <mutex>

namespace quay {

// Shared error bookkeeping and command plumbing for the concrete collectors.
class PortCollectorBase : public IPortCollector {
public:
    explicit PortCollectorBase(ICommandRunner* runner);
    ~PortCollectorBase() override = default;

    std::vector<SourceError> get_recent_errors() override;
    void clear_errors() override;

    static constexpr std::chrono::milliseconds kLocalTimeout{5000};
    static constexpr std::chrono::milliseconds kRemoteTimeout{15000};
    static constexpr size_t kMaxErrors = 10;

protected:
    void add_error(const std::string& message);

    // Runs argv (wrapped in ssh when remote_host is set). Returns stdout,
    // or nullopt after recording an error. quiet_exit_ok accepts a non-zero
    // exit that printed nothing at all (lsof with no matches).
    std::optional<std::string> run_capture(const std::vector<std::string>& argv,
                                           const std::optional<std::string>& remote_host,
                                           bool quiet_exit_ok = false);

    ICommandRunner* runner_ = nullptr;

private:
    mutable std::mutex errors_mutex_;
    std::vector<SourceError> recent_errors_;
};

} // namespace quay
