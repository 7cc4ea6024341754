/*
 * LocalSim runtime - RPC binder (declaration)
 * (c) 2025 LocalSim contributors
 */
#pragma once
#include "include/CommandRegistry.hpp"
#include "include/Runtime.hpp"

namespace lsim {
    // Registers all wire commands into the given registry.
    void BindRuntimeRpcCommands(Runtime& rt, CommandRegistry& reg);
}
