/*
 * LocalSim runtime - Typed command payloads
 * Every struct validates its JSON shape in fromJson() and throws ParamError
 * with the message that goes back to the peer.
 * (c) 2025 LocalSim contributors
 */
#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lsim {

class ParamError : public std::invalid_argument {
public:
    explicit ParamError(const std::string& what) : std::invalid_argument(what) {}
};

/* READ_VARS {names?: [string]} */
struct ReadVarsParams {
    std::vector<std::string> names;
    static ReadVarsParams fromJson(const nlohmann::json& payload);
};

/* SET_VARS {values?: {name: value}} */
struct SetVarsParams {
    nlohmann::json values = nlohmann::json::object();
    static SetVarsParams fromJson(const nlohmann::json& payload);
};

/* FORCE_SET {owner_id: string, values?: {name: value}} */
struct ForceSetParams {
    std::string    ownerId;
    nlohmann::json values = nlohmann::json::object();
    static ForceSetParams fromJson(const nlohmann::json& payload);
};

/* FORCE_CLEAR {owner_id: string, names?: [string], all?: bool} */
struct ForceClearParams {
    std::string ownerId;
    std::optional<std::vector<std::string>> names;
    bool all{false};
    static ForceClearParams fromJson(const nlohmann::json& payload);
};

/* LOAD_PROJECT {project, pages, vars: object, sources: {path: text}, meta?: object} */
struct LoadProjectParams {
    nlohmann::json project;
    nlohmann::json pages;
    nlohmann::json vars;
    std::map<std::string, std::string> sources;
    nlohmann::json meta = nlohmann::json::object();
    static LoadProjectParams fromJson(const nlohmann::json& payload);
};

} // namespace lsim
