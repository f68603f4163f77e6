#pragma once

#include <string>

namespace platform {

// Directory holding config.json. Empty if no home directory is known.
std::string config_dir();

// Per-service directory under the FGP base path, e.g. ~/.fgp/services/vercel.
std::string service_dir();

// Default local socket the daemon listens on.
std::string ipc_endpoint();

} // namespace platform
