#include "../platform_factory.hpp"

#include "linux_command_runner.hpp"
#include "linux_port_prober.hpp"

namespace quay {

std::unique_ptr<ICommandRunner> make_command_runner() {
    return std::make_unique<LinuxCommandRunner>();
}

std::unique_ptr<IPortProber> make_port_prober() {
    return std::make_unique<LinuxPortProber>();
}

} // namespace quay
