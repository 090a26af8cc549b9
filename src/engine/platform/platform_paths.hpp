#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/termstream, falling back to ~/.config/termstream.
// Empty if neither variable is set.
std::string config_dir();

} // namespace platform
