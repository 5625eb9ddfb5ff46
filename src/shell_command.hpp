#pragma once

#include <optional>
#include <string>
#include <vector>

namespace quay {

// Quotes a single argument for a POSIX shell. Plain words are left alone.
std::string shell_quote(const std::string& arg);

// Joins argv into one shell command line, quoting where needed.
std::string shell_join(const std::vector<std::string>& argv);

// Returns argv unchanged for local execution, or {"ssh", host, "<joined argv>"}
// so the command runs on remote_host.
std::vector<std::string> with_remote(const std::vector<std::string>& argv,
                                     const std::optional<std::string>& remote_host);

// Splits on runs of spaces and tabs.
std::vector<std::string> split_whitespace(const std::string& line);

std::string trim(const std::string& s);

} // namespace quay
