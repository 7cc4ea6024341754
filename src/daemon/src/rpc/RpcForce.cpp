/*
 * LocalSim runtime - RPC: Forces (FORCE_SET/FORCE_CLEAR/GET_FORCES)
 * (c) 2025 LocalSim contributors
 */
#include <nlohmann/json.hpp>

#include "include/CommandRegistry.hpp"
#include "include/Params.hpp"
#include "include/Runtime.hpp"
#include "include/Log.hpp"

namespace lsim {

using nlohmann::json;

void BindRpcForce(Runtime& rt, CommandRegistry& reg) {
    // Params: { owner_id: string, values: {name: value} }
    // The calling connection becomes the owner's connection.
    reg.add(
        "FORCE_SET",
        "Force values for an owner (cleared when its connection closes)",
        [&rt](const Request& rq, Session& s) -> Response {
            const auto p = ForceSetParams::fromJson(rq.payload);
            const std::size_t n = rt.forces().set(p.ownerId, s.connId, p.values);
            LOG_DEBUG("rpc FORCE_SET owner='%s' n=%zu conn=%llu",
                      p.ownerId.c_str(), n, static_cast<unsigned long long>(s.connId));
            return ok_(rq, json{{"owner_id", p.ownerId}, {"count", n}});
        }
    );

    // Params: { owner_id: string, names?: [string], all?: bool }
    reg.add(
        "FORCE_CLEAR",
        "Clear some or all forces of an owner",
        [&rt](const Request& rq, Session&) -> Response {
            const auto p = ForceClearParams::fromJson(rq.payload);
            rt.forces().clear(p.ownerId, p.names, p.all);
            LOG_DEBUG("rpc FORCE_CLEAR owner='%s' all=%s", p.ownerId.c_str(), p.all ? "true" : "false");
            return ok_(rq, json{{"owner_id", p.ownerId}});
        }
    );

    reg.add(
        "GET_FORCES",
        "List forces as {owner_id, name, value}",
        [&rt](const Request& rq, Session&) -> Response {
            return ok_(rq, json{{"forces", rt.forces().snapshot()}});
        }
    );
}

} // namespace lsim
