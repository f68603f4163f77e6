#pragma once

#include "upstream/upstream_api.hpp"

#include <chrono>

// Process-wide state handed to every method handler. Built once at startup by
// the event loop and torn down with it.
struct DaemonContext {
    UpstreamApi& upstream;
    std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now();
};
