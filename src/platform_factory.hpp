#pragma once

#include "interfaces/i_command_runner.hpp"
#include "interfaces/i_port_prober.hpp"
#include <memory>

namespace quay {

// Factory functions for the platform-specific pieces.
// Implemented per-platform; current build provides Linux implementations.
std::unique_ptr<ICommandRunner> make_command_runner();
std::unique_ptr<IPortProber> make_port_prober();

} // namespace quay
