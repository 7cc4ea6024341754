/*
 * LocalSim runtime - Daemon configuration (implementation)
 * (c) 2025 LocalSim contributors
 *
 *  - Defaults and an optional JSON file are the source of truth.
 *  - ENV is a fallback layer below the file:
 *      Defaults  ->  ENV  ->  config.json
 */

#include "include/Config.hpp"
#include "include/Utils.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

using nlohmann::json;

namespace lsim {

/* ----------------------------------------------------------------------------
 * helpers (env)
 * ----------------------------------------------------------------------------*/

static inline int getenv_int(const char* key, int def) {
    auto v = util::getenv_str(key);
    if (!v || v->empty()) return def;
    try { return std::stoi(*v); } catch (const std::exception&) { return def; }
}

static inline double getenv_double(const char* key, double def) {
    auto v = util::getenv_str(key);
    if (!v || v->empty()) return def;
    try { return std::stod(*v); } catch (const std::exception&) { return def; }
}

/* ----------------------------------------------------------------------------
 * json deserialization
 * ----------------------------------------------------------------------------*/

void from_json(const json& j, RuntimeConfig& c) {
    if (j.contains("host"))          j.at("host").get_to(c.host);
    if (j.contains("port"))          j.at("port").get_to(c.port);
    if (j.contains("logfile"))       j.at("logfile").get_to(c.logfile);
    if (j.contains("logLevel"))      j.at("logLevel").get_to(c.logLevel);
    if (j.contains("maxFrameBytes")) j.at("maxFrameBytes").get_to(c.maxFrameBytes);
    if (j.contains("scanMs"))        j.at("scanMs").get_to(c.scanMs);
}

/* ----------------------------------------------------------------------------
 * Defaults / ENV
 * ----------------------------------------------------------------------------*/

RuntimeConfig defaultConfig() {
    return RuntimeConfig{};
}

void applyEnvOverrides(RuntimeConfig& c) {
    if (auto h = util::getenv_str("LOCALSIM_HOST"); h && !h->empty()) c.host = *h;
    c.port = getenv_int("LOCALSIM_PORT", c.port);

    if (auto l = util::getenv_str("LOCALSIM_LOG"); l && !l->empty()) c.logLevel = *l;
    if (auto f = util::getenv_str("LOCALSIM_LOGFILE"); f && !f->empty()) c.logfile = *f;

    c.scanMs = getenv_double("LOCALSIM_SCAN_MS", c.scanMs);

    const int maxFrame = getenv_int("LOCALSIM_MAX_FRAME", static_cast<int>(c.maxFrameBytes));
    if (maxFrame > 0) c.maxFrameBytes = static_cast<std::uint32_t>(maxFrame);
}

/* ----------------------------------------------------------------------------
 * File API
 * ----------------------------------------------------------------------------*/

RuntimeConfig loadRuntimeConfig(const std::string& path) {
    RuntimeConfig c = defaultConfig();
    applyEnvOverrides(c);

    if (!path.empty()) {
        const std::string p = util::expandUserPath(path);
        json j = util::read_json_file(p);
        if (!j.is_object()) {
            throw std::runtime_error("config '" + p + "' must contain a JSON object");
        }
        try {
            from_json(j, c);            // file wins over ENV
        } catch (const json::exception& ex) {
            throw std::runtime_error("config '" + p + "': " + ex.what());
        }
        c.configFile = p;
    }

    c.logfile = util::expandUserPath(c.logfile);
    return c;
}

RuntimeConfig loadRuntimeConfig(const std::string& path, std::string* err) {
    if (err) err->clear();
    try {
        return loadRuntimeConfig(path);
    } catch (const std::exception& ex) {
        if (err) *err = ex.what();
    }
    RuntimeConfig c = defaultConfig();
    applyEnvOverrides(c);
    return c;
}

std::string validateConfig(const RuntimeConfig& c) {
    if (c.host.empty()) return "host must not be empty";
    if (c.port < 0 || c.port > 65535) return "port out of range: " + std::to_string(c.port);
    if (!(c.scanMs > 0.0)) return "scanMs must be positive";
    if (c.maxFrameBytes == 0 || c.maxFrameBytes > kMaxFrameBytes) {
        return "maxFrameBytes must be within 1.." + std::to_string(kMaxFrameBytes);
    }
    return {};
}

} // namespace lsim
