#include "shell_command.hpp"
#include <sstream>

namespace quay {

namespace {

bool is_plain_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '/' || c == ':' || c == '@' ||
           c == '=' || c == ',' || c == '+';
}

} // namespace

std::string shell_quote(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }

    bool plain = true;
    for (char c : arg) {
        if (!is_plain_char(c)) {
            plain = false;
            break;
        }
    }
    if (plain) {
        return arg;
    }

    // Single quotes cannot be escaped inside single quotes: close, escape, reopen
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string shell_join(const std::vector<std::string>& argv) {
    std::string line;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) line += ' ';
        line += shell_quote(argv[i]);
    }
    return line;
}

std::vector<std::string> with_remote(const std::vector<std::string>& argv,
                                     const std::optional<std::string>& remote_host) {
    if (!remote_host) {
        return argv;
    }
    return {"ssh", *remote_host, shell_join(argv)};
}

std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    const size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

} // namespace quay
