/*
 * LocalSim runtime - Simulated runtime state
 * Lifecycle, variable table, force table and the loaded project.
 * (c) 2025 LocalSim contributors
 *
 * Not thread-safe: one instance is owned by the Daemon and only touched from
 * the connection loop thread, one command at a time.
 */
#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "ForceTable.hpp"
#include "Params.hpp"
#include "ProjectBundle.hpp"

namespace lsim {

enum class LifecycleState { Stop, Run, Error };

/* "STOP" | "RUN" | "ERROR" */
const char* toString(LifecycleState s);

class LifecycleError : public std::runtime_error {
public:
    explicit LifecycleError(const std::string& what) : std::runtime_error(what) {}
};

class Runtime {
public:
    explicit Runtime(double nominalScanMs = 10.0);

    LifecycleState state() const noexcept { return state_; }
    const std::string& lastError() const noexcept { return lastError_; }
    long long uptimeMs() const;

    double effectiveScanMs() const noexcept { return scanMs_; }
    /* SIM: no scan cycle is executed, so no round is ever measured. */
    double roundTimeMs() const noexcept { return roundTimeMs_; }

    /* STOP -> RUN. Throws LifecycleError in ERROR or without a project. */
    void start();

    /* Any state -> STOP, ERROR included. last_error is kept. */
    void stop();

    /* Enter ERROR with a message. START refuses until STOP or LOAD_PROJECT. */
    void fault(const std::string& message);

    /* Forced value if any, else stored value, else null, per name. */
    nlohmann::json readVars(const std::vector<std::string>& names) const;

    /* Merge into the variable table; returns the number of names written. */
    std::size_t setVars(const nlohmann::json& values);

    /* Replace the bundle and force STOP from any state. */
    const ProjectSummary& loadProject(LoadProjectParams params);

    bool projectLoaded() const noexcept { return project_.loaded(); }

    ForceTable&          forces()        noexcept { return forces_; }
    const ForceTable&    forces()  const noexcept { return forces_; }
    const ProjectStore&  project() const noexcept { return project_; }

    // Payload builders shared by the RPC handlers
    nlohmann::json pingJson() const;
    nlohmann::json statusJson() const;
    nlohmann::json diagJson() const;

    /* Command names advertised in PING caps. */
    static const std::vector<std::string>& capabilities();

private:
    void setState_(LifecycleState next);

    LifecycleState                             state_{LifecycleState::Stop};
    std::string                                lastError_;
    std::chrono::steady_clock::time_point      started_;
    double                                     scanMs_;
    double                                     roundTimeMs_{0.0};

    std::unordered_map<std::string, nlohmann::json> vars_;
    ForceTable                                 forces_;
    ProjectStore                               project_;
};

} // namespace lsim
