/*
 * LocalSim runtime - RPC: Core bindings (PING/GET_STATUS/GET_DIAG)
 * (c) 2025 LocalSim contributors
 */
#include "include/CommandRegistry.hpp"
#include "include/Runtime.hpp"
#include "include/Log.hpp"

namespace lsim {

void BindRpcCore(Runtime& rt, CommandRegistry& reg) {
    // Liveness probe, also advertises the command set
    reg.add(
        "PING",
        "Liveness probe: state, uptime, project flag, caps",
        [&rt](const Request& rq, Session&) -> Response {
            LOG_TRACE("rpc PING");
            return ok_(rq, rt.pingJson());
        }
    );

    reg.add(
        "GET_STATUS",
        "Lifecycle state, last error, scan figures, project summary",
        [&rt](const Request& rq, Session&) -> Response {
            LOG_TRACE("rpc GET_STATUS");
            return ok_(rq, rt.statusJson());
        }
    );

    // SIM: no boards
    reg.add(
        "GET_DIAG",
        "Diagnostics snapshot (scan timings, boards)",
        [&rt](const Request& rq, Session&) -> Response {
            LOG_TRACE("rpc GET_DIAG");
            return ok_(rq, rt.diagJson());
        }
    );
}

} // namespace lsim
