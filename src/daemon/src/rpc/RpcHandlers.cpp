/*
 * LocalSim runtime - RPC binder (thin aggregator)
 * (c) 2025 LocalSim contributors
 */
#include "rpc/RpcHandlers.hpp"
#include "include/Log.hpp"

namespace lsim {
// Forward declarations for all RPC binders
void BindRpcCore(Runtime&, CommandRegistry&);
void BindRpcLifecycle(Runtime&, CommandRegistry&);
void BindRpcVars(Runtime&, CommandRegistry&);
void BindRpcForce(Runtime&, CommandRegistry&);
void BindRpcProject(Runtime&, CommandRegistry&);

// Keep this file tiny; all handlers live in src/rpc/*
void BindRuntimeRpcCommands(Runtime& rt, CommandRegistry& reg) {
    LOG_TRACE("rpc: binding commands");

    // Liveness / status / diagnostics
    BindRpcCore(rt, reg);

    // START / STOP / SHUTDOWN
    BindRpcLifecycle(rt, reg);

    // Variable table
    BindRpcVars(rt, reg);

    // Debug forces
    BindRpcForce(rt, reg);

    // Project bundle ingestion
    BindRpcProject(rt, reg);

    LOG_DEBUG("rpc: %zu commands bound", reg.size());
}

} // namespace lsim
