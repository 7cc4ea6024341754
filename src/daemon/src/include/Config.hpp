/*
 * LocalSim runtime - Daemon configuration (public interface)
 * (c) 2025 LocalSim contributors
 *
 * NOTE:
 *  - Precedence: defaults -> ENV (LOCALSIM_*) -> JSON file -> CLI flags.
 *  - CLI flags are applied by main.cpp on top of loadRuntimeConfig().
 */
#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace lsim {

/* Hard cap on one frame body, also the ceiling for maxFrameBytes. */
constexpr std::uint32_t kMaxFrameBytes = 10000000;

/* ----------------------------------------------------------------------------
 * Runtime configuration model
 * ----------------------------------------------------------------------------*/
struct RuntimeConfig {
    // Listener
    std::string   host{"127.0.0.1"};
    int           port{1963};

    // Logging
    std::string   logfile;            // empty = no file
    std::string   logLevel{"info"};

    // Protocol
    std::uint32_t maxFrameBytes{kMaxFrameBytes};

    // Simulated nominal scan time reported by GET_STATUS / GET_DIAG
    double        scanMs{10.0};

    // Where this config was read from (empty = defaults/ENV only)
    std::string   configFile;
};

// JSON file -> RuntimeConfig (only keys present are applied)
void from_json(const nlohmann::json& j, RuntimeConfig& c);

/* Built-in defaults (no ENV, no file). */
RuntimeConfig defaultConfig();

/* Overlay LOCALSIM_* environment variables onto c. */
void applyEnvOverrides(RuntimeConfig& c);

/*
 * Defaults + ENV, then the JSON file at path (if non-empty).
 * Throws std::runtime_error when the file is missing, unparsable or has wrong types.
 */
RuntimeConfig loadRuntimeConfig(const std::string& path);

/* Convenience: same as above but reports failures through err; returns defaults+ENV on failure. */
RuntimeConfig loadRuntimeConfig(const std::string& path, std::string* err);

/* Returns an empty string when valid, otherwise a human-readable reason. */
std::string validateConfig(const RuntimeConfig& c);

} // namespace lsim
