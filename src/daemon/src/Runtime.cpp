/*
 * LocalSim runtime - Simulated runtime state (implementation)
 * (c) 2025 LocalSim contributors
 */
#include "include/Runtime.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

namespace lsim {

using nlohmann::json;

const char* toString(LifecycleState s) {
    switch (s) {
        case LifecycleState::Stop:  return "STOP";
        case LifecycleState::Run:   return "RUN";
        case LifecycleState::Error: return "ERROR";
    }
    return "STOP";
}

Runtime::Runtime(double nominalScanMs)
: started_(std::chrono::steady_clock::now()),
  scanMs_(nominalScanMs) {}

long long Runtime::uptimeMs() const {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now() - started_).count();
}

void Runtime::setState_(LifecycleState next) {
    if (next == state_) return;
    LOG_INFO("runtime: %s -> %s", toString(state_), toString(next));
    state_ = next;
}

void Runtime::start() {
    if (state_ == LifecycleState::Error) {
        throw LifecycleError("Runtime in ERROR: STOP then clear error");
    }
    if (!project_.loaded()) {
        throw LifecycleError("No project loaded. Use LOAD_PROJECT first.");
    }
    setState_(LifecycleState::Run);
}

void Runtime::stop() {
    setState_(LifecycleState::Stop);
}

void Runtime::fault(const std::string& message) {
    lastError_ = message;
    LOG_ERROR("runtime: fault: %s", message.c_str());
    setState_(LifecycleState::Error);
}

json Runtime::readVars(const std::vector<std::string>& names) const {
    json values = json::object();
    for (const auto& n : names) {
        if (auto forced = forces_.forcedValue(n)) {
            values[n] = std::move(*forced);
            continue;
        }
        auto it = vars_.find(n);
        values[n] = (it != vars_.end()) ? it->second : json(nullptr);
    }
    return values;
}

std::size_t Runtime::setVars(const json& values) {
    if (!values.is_object()) return 0;
    for (const auto& kv : values.items()) {
        vars_[kv.key()] = kv.value();
    }
    return values.size();
}

const ProjectSummary& Runtime::loadProject(LoadProjectParams params) {
    const ProjectSummary& s = project_.load(std::move(params), util::utc_iso8601());
    LOG_INFO("runtime: project '%s' loaded (pages=%zu sheets=%zu files=%zu st=%zu bytes=%zu)",
             s.name.c_str(), s.pages, s.sheets, s.files, s.stFiles, s.bytes);
    stop();
    return s;
}

const std::vector<std::string>& Runtime::capabilities() {
    static const std::vector<std::string> caps{
        "PING", "GET_STATUS", "START", "STOP", "GET_DIAG",
        "READ_VARS", "SET_VARS", "FORCE_SET", "FORCE_CLEAR", "GET_FORCES",
        "LOAD_PROJECT", "SHUTDOWN"
    };
    return caps;
}

json Runtime::pingJson() const {
    return json{
        {"resp",           "PONG"},
        {"runtime_state",  toString(state_)},
        {"uptime_ms",      uptimeMs()},
        {"project_loaded", project_.loaded()},
        {"caps",           capabilities()}
    };
}

json Runtime::statusJson() const {
    return json{
        {"runtime_state",     toString(state_)},
        {"last_error",        lastError_},
        {"effective_scan_ms", effectiveScanMs()},
        {"round_time_ms",     roundTimeMs()},
        {"uptime_ms",         uptimeMs()},
        {"project_loaded",    project_.loaded()},
        {"project_info",      project_.summaryJson()}
    };
}

json Runtime::diagJson() const {
    return json{
        {"runtime_state",     toString(state_)},
        {"round_time_ms",     roundTimeMs()},
        {"effective_scan_ms", effectiveScanMs()},
        {"boards",            json::array()}
    };
}

} // namespace lsim
