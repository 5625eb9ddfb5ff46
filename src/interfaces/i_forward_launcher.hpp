#pragma once

#include <string>

namespace quay {

struct ForwardResult {
    bool success = false;
    int pid = -1;
    std::string error_message;
};

class IForwardLauncher {
public:
    virtual ~IForwardLauncher() = default;

    // spec is "local_port:remote_host:remote_port"; reverse selects -R over -L.
    virtual ForwardResult create_forward(const std::string& spec, const std::string& host,
                                         bool reverse) = 0;
};

} // namespace quay
