#pragma once

#include "interfaces/i_forward_launcher.hpp"
#include "interfaces/i_command_runner.hpp"

namespace quay {

// Starts `ssh -f -N -L|-R <spec> <host>` in the background.
class SshForwarder : public IForwardLauncher {
public:
    explicit SshForwarder(ICommandRunner* runner);
    ~SshForwarder() override = default;

    ForwardResult create_forward(const std::string& spec, const std::string& host, bool reverse) override;

private:
    ICommandRunner* runner_ = nullptr;
};

} // namespace quay
