/*
 * LocalSim runtime - Typed command payloads (implementation)
 * (c) 2025 LocalSim contributors
 */
#include "include/Params.hpp"

namespace lsim {

using nlohmann::json;

static const json* member_(const json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) return nullptr;
    return &*it;
}

static std::vector<std::string> stringArray_(const json& v, const char* errMsg) {
    if (!v.is_array()) throw ParamError(errMsg);
    std::vector<std::string> out;
    out.reserve(v.size());
    for (const auto& e : v) {
        if (!e.is_string()) throw ParamError(errMsg);
        out.push_back(e.get<std::string>());
    }
    return out;
}

static std::string ownerId_(const json& payload) {
    const json* v = member_(payload, "owner_id");
    if (!v || !v->is_string() || v->get_ref<const std::string&>().empty()) {
        throw ParamError("payload.owner_id required");
    }
    return v->get<std::string>();
}

static json valuesObject_(const json& payload) {
    const json* v = member_(payload, "values");
    if (!v) return json::object();
    if (!v->is_object()) throw ParamError("payload.values must be object");
    return *v;
}

ReadVarsParams ReadVarsParams::fromJson(const json& payload) {
    ReadVarsParams p;
    if (const json* v = member_(payload, "names")) {
        p.names = stringArray_(*v, "payload.names must be array of strings");
    }
    return p;
}

SetVarsParams SetVarsParams::fromJson(const json& payload) {
    SetVarsParams p;
    p.values = valuesObject_(payload);
    return p;
}

ForceSetParams ForceSetParams::fromJson(const json& payload) {
    ForceSetParams p;
    p.ownerId = ownerId_(payload);
    p.values  = valuesObject_(payload);
    return p;
}

ForceClearParams ForceClearParams::fromJson(const json& payload) {
    ForceClearParams p;
    p.ownerId = ownerId_(payload);
    if (const json* v = member_(payload, "all")) {
        if (!v->is_boolean()) throw ParamError("payload.all must be boolean");
        p.all = v->get<bool>();
    }
    if (const json* v = member_(payload, "names")) {
        p.names = stringArray_(*v, "payload.names must be array of strings");
    }
    return p;
}

LoadProjectParams LoadProjectParams::fromJson(const json& payload) {
    static const char* const kObjects[] = {"project", "pages", "vars", "sources"};
    for (const char* key : kObjects) {
        const json* v = member_(payload, key);
        if (!v || !v->is_object()) {
            throw ParamError(std::string("payload.") + key + " must be object");
        }
    }

    LoadProjectParams p;
    p.project = payload.at("project");
    p.pages   = payload.at("pages");
    p.vars    = payload.at("vars");

    for (const auto& kv : payload.at("sources").items()) {
        if (kv.key().empty()) {
            throw ParamError("payload.sources keys must be non-empty strings");
        }
        if (!kv.value().is_string()) {
            throw ParamError("payload.sources values must be strings");
        }
        p.sources.emplace(kv.key(), kv.value().get<std::string>());
    }

    if (const json* m = member_(payload, "meta")) {
        if (!m->is_object()) throw ParamError("payload.meta must be object");
        p.meta = *m;
    }
    return p;
}

} // namespace lsim
