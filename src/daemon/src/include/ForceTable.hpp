/*
 * LocalSim runtime - Force table
 * owner id -> forced values, plus connection id -> owner ids for bulk
 * cleanup when a debugging session goes away.
 * (c) 2025 LocalSim contributors
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace lsim {

using ConnId = std::uint64_t;

/*
 * Invariants:
 *  - an owner is never present with zero forced names;
 *  - owner O is in byConn_[C] iff byOwner_[O].conn == C.
 * When two owners force the same name, the most recent FORCE_SET wins.
 */
class ForceTable {
public:
    /* Create or extend `owner` with `values` (object) and (re)assign it to `conn`.
     * Returns the number of names written. An empty object creates nothing. */
    std::size_t set(const std::string& owner, ConnId conn, const nlohmann::json& values);

    /* Remove `names` from `owner`, or the whole owner when `all` is set or names
     * is absent/empty. Unknown owners and names are ignored. */
    void clear(const std::string& owner,
               const std::optional<std::vector<std::string>>& names,
               bool all);

    /* Drop every owner last touched by `conn`; returns how many were dropped. */
    std::size_t clearByConnection(ConnId conn);

    /* Effective forced value for `name`, if any owner forces it. */
    std::optional<nlohmann::json> forcedValue(const std::string& name) const;

    /* [{owner_id, name, value}, ...] ordered by owner then name. */
    nlohmann::json snapshot() const;

    bool hasOwner(const std::string& owner) const { return byOwner_.count(owner) != 0; }
    std::size_t ownerCount() const noexcept { return byOwner_.size(); }
    std::optional<ConnId> connectionOf(const std::string& owner) const;
    std::vector<std::string> ownersOf(ConnId conn) const;

private:
    struct Forced {
        nlohmann::json value;
        std::uint64_t  seq{0};     // FORCE_SET sequence that wrote it
    };
    struct Entry {
        ConnId conn{0};
        std::map<std::string, Forced> values;
    };

    void eraseOwner_(std::map<std::string, Entry>::iterator it);

    std::map<std::string, Entry>                          byOwner_;
    std::unordered_map<ConnId, std::set<std::string>>     byConn_;
    std::uint64_t                                         seq_{0};
};

} // namespace lsim
