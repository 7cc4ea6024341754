/*
 * LocalSim runtime - RPC: Lifecycle (START/STOP/SHUTDOWN)
 * (c) 2025 LocalSim contributors
 */
#include <nlohmann/json.hpp>

#include "include/CommandRegistry.hpp"
#include "include/Runtime.hpp"
#include "include/Log.hpp"

namespace lsim {

using nlohmann::json;

void BindRpcLifecycle(Runtime& rt, CommandRegistry& reg) {
    // STOP -> RUN; LifecycleError is turned into the error envelope by the registry
    reg.add(
        "START",
        "Switch STOP -> RUN (requires a loaded project)",
        [&rt](const Request& rq, Session&) -> Response {
            rt.start();
            return ok_(rq, json{{"runtime_state", toString(rt.state())}});
        }
    );

    reg.add(
        "STOP",
        "Switch to STOP",
        [&rt](const Request& rq, Session&) -> Response {
            rt.stop();
            return ok_(rq, json{{"runtime_state", toString(rt.state())}});
        }
    );

    // The reply is queued before the connection loop acts on the flags.
    reg.add(
        "SHUTDOWN",
        "Stop accepting connections; open sessions run to completion",
        [](const Request& rq, Session& s) -> Response {
            LOG_INFO("rpc SHUTDOWN from %s (conn=%llu)",
                     s.peer.c_str(), static_cast<unsigned long long>(s.connId));
            s.closeAfterReply = true;
            s.shutdownServer  = true;
            return ok_(rq, json{{"shutting_down", true}});
        }
    );
}

} // namespace lsim
