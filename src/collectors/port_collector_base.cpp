#include "port_collector_base.hpp"
#include "../shell_command.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace quay {

PortCollectorBase::PortCollectorBase(ICommandRunner* runner)
    : runner_(runner)
{
}

void PortCollectorBase::add_error(const std::string& message) {
    spdlog::warn("[{}] {}", name(), message);
    std::lock_guard lock(errors_mutex_);
    recent_errors_.push_back({std::chrono::steady_clock::now(), name(), message});
    if (recent_errors_.size() > kMaxErrors) {
        recent_errors_.erase(recent_errors_.begin());
    }
}

std::vector<SourceError> PortCollectorBase::get_recent_errors() {
    std::lock_guard lock(errors_mutex_);
    return recent_errors_;
}

void PortCollectorBase::clear_errors() {
    std::lock_guard lock(errors_mutex_);
    recent_errors_.clear();
}

std::optional<std::string> PortCollectorBase::run_capture(const std::vector<std::string>& argv,
                                                          const std::optional<std::string>& remote_host,
                                                          bool quiet_exit_ok) {
    const auto command = with_remote(argv, remote_host);
    const auto timeout = remote_host ? kRemoteTimeout : kLocalTimeout;
    spdlog::debug("[{}] running: {}", name(), shell_join(command));

    CommandResult result = runner_->run(command, timeout);
    if (!result.launched) {
        add_error(result.error_message);
        return std::nullopt;
    }
    if (result.timed_out) {
        add_error(fmt::format("'{}' timed out", command.front()));
        return std::nullopt;
    }
    if (result.exit_code != 0 && quiet_exit_ok && result.out.empty() && trim(result.err).empty()) {
        return std::string{};
    }
    if (result.exit_code != 0) {
        add_error(fmt::format("'{}' exited with {}: {}", shell_join(argv), result.exit_code,
                              trim(result.err)));
        return std::nullopt;
    }
    return std::move(result.out);
}

} // namespace quay
