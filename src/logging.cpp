#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <system_error>
#include <vector>

namespace quay::logging {

namespace {

constexpr size_t kMaxLogSize = 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

spdlog::level::level_enum parse_level(const std::string& name) {
    // from_str maps unknown names to off
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace

std::optional<std::filesystem::path> log_file_path() {
    if (const char* state = std::getenv("XDG_STATE_HOME"); state && *state) {
        return std::filesystem::path(state) / "quay" / "quay.log";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".local" / "state" / "quay" / "quay.log";
    }
    return std::nullopt;
}

void init(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;

    if (auto path = options.file ? options.file : log_file_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path->parent_path(), ec);
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path->string(), kMaxLogSize, kMaxLogFiles);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex&) {
            // Unwritable state directory: run without a log file
        }
    }

    if (options.stderr_sink) {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(spdlog::level::warn);
        console_sink->set_pattern("%^%l%$: %v");
        sinks.push_back(console_sink);
    }

    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("quay", sinks.begin(), sinks.end());
    logger->set_level(parse_level(options.level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void set_level(const std::string& level) {
    spdlog::set_level(parse_level(level));
}

} // namespace quay::logging
