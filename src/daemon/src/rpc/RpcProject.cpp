/*
 * LocalSim runtime - RPC: Project bundle (LOAD_PROJECT)
 * (c) 2025 LocalSim contributors
 */
#include <nlohmann/json.hpp>

#include "include/CommandRegistry.hpp"
#include "include/Params.hpp"
#include "include/Runtime.hpp"
#include "include/Log.hpp"

namespace lsim {

using nlohmann::json;

void BindRpcProject(Runtime& rt, CommandRegistry& reg) {
    // Params: { project, pages, vars: object, sources: {path: text}, meta?: object }
    // The whole payload is validated before anything is replaced.
    reg.add(
        "LOAD_PROJECT",
        "Replace the project bundle and force STOP",
        [&rt](const Request& rq, Session& s) -> Response {
            auto p = LoadProjectParams::fromJson(rq.payload);
            LOG_INFO("rpc LOAD_PROJECT from %s (%zu sources)", s.peer.c_str(), p.sources.size());
            const ProjectSummary& summary = rt.loadProject(std::move(p));
            return ok_(rq, json{{"loaded", true}, {"project_info", summary.toJson()}});
        }
    );
}

} // namespace lsim
