#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/fgp-vercel";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/fgp-vercel";
}

std::string service_dir() {
    const char* fgp_home = std::getenv("FGP_HOME");
    if (fgp_home && *fgp_home) return std::string(fgp_home) + "/services/vercel";
    const char* home = std::getenv("HOME");
    if (!home) return "/tmp/fgp/services/vercel";
    return std::string(home) + "/.fgp/services/vercel";
}

std::string ipc_endpoint() {
    return service_dir() + "/daemon.sock";
}

} // namespace platform
