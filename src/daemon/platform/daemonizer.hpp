#pragma once

namespace platform {

// Detach from the controlling terminal. The parent process exits.
void daemonize();

} // namespace platform
