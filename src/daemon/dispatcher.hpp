#pragma once

#include "daemon_context.hpp"
#include "method_registry.hpp"
#include "protocol.hpp"

#include <string>
#include <string_view>

// Decode, validate, invoke, encode. Every failure past framing becomes an
// ok:false Response; only framing failures ask the caller to close.
class Dispatcher {
public:
    Dispatcher(const MethodRegistry& registry, DaemonContext& ctx, bool verbose = false);

    Response dispatch(const Request& req);

    // Decode one frame and dispatch it. Sets `close_after` when the frame
    // itself was unusable and the connection must be dropped after replying.
    Response handle_frame(std::string_view frame, bool& close_after);

private:
    void log(const std::string& msg);

    const MethodRegistry& registry_;
    DaemonContext& ctx_;
    bool verbose_;
};
