/*
 * LocalSim runtime - RPC: Variable table (READ_VARS/SET_VARS)
 * (c) 2025 LocalSim contributors
 */
#include <nlohmann/json.hpp>

#include "include/CommandRegistry.hpp"
#include "include/Params.hpp"
#include "include/Runtime.hpp"
#include "include/Log.hpp"

namespace lsim {

using nlohmann::json;

void BindRpcVars(Runtime& rt, CommandRegistry& reg) {
    // Params: { names: [string] }; forced values overlay stored ones
    reg.add(
        "READ_VARS",
        "Read variables (forced value wins, null if never set)",
        [&rt](const Request& rq, Session&) -> Response {
            const auto p = ReadVarsParams::fromJson(rq.payload);
            LOG_TRACE("rpc READ_VARS n=%zu", p.names.size());
            return ok_(rq, json{{"values", rt.readVars(p.names)}});
        }
    );

    // Params: { values: {name: value} }
    // Accepted in any lifecycle state.
    reg.add(
        "SET_VARS",
        "Merge values into the variable table",
        [&rt](const Request& rq, Session&) -> Response {
            const auto p = SetVarsParams::fromJson(rq.payload);
            const std::size_t n = rt.setVars(p.values);
            LOG_TRACE("rpc SET_VARS n=%zu", n);
            return ok_(rq, json{{"count", n}});
        }
    );
}

} // namespace lsim
