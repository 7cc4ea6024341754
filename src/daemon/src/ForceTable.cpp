/*
 * LocalSim runtime - Force table (implementation)
 * (c) 2025 LocalSim contributors
 */
#include "include/ForceTable.hpp"

namespace lsim {

using nlohmann::json;

std::size_t ForceTable::set(const std::string& owner, ConnId conn, const json& values) {
    auto it = byOwner_.find(owner);
    if (it == byOwner_.end()) {
        if (!values.is_object() || values.empty()) return 0;
        it = byOwner_.emplace(owner, Entry{}).first;
        it->second.conn = conn;
        byConn_[conn].insert(owner);
    } else if (it->second.conn != conn) {
        // Re-forcing from another connection moves ownership.
        auto old = byConn_.find(it->second.conn);
        if (old != byConn_.end()) {
            old->second.erase(owner);
            if (old->second.empty()) byConn_.erase(old);
        }
        it->second.conn = conn;
        byConn_[conn].insert(owner);
    }

    if (!values.is_object()) return 0;

    const std::uint64_t seq = ++seq_;
    for (const auto& kv : values.items()) {
        it->second.values[kv.key()] = Forced{kv.value(), seq};
    }
    return values.size();
}

void ForceTable::clear(const std::string& owner,
                       const std::optional<std::vector<std::string>>& names,
                       bool all) {
    auto it = byOwner_.find(owner);
    if (it == byOwner_.end()) return;

    if (all || !names || names->empty()) {
        eraseOwner_(it);
        return;
    }
    for (const auto& n : *names) {
        it->second.values.erase(n);
    }
    if (it->second.values.empty()) {
        eraseOwner_(it);
    }
}

std::size_t ForceTable::clearByConnection(ConnId conn) {
    auto c = byConn_.find(conn);
    if (c == byConn_.end()) return 0;

    const std::set<std::string> owners = std::move(c->second);
    byConn_.erase(c);
    for (const auto& o : owners) {
        byOwner_.erase(o);
    }
    return owners.size();
}

void ForceTable::eraseOwner_(std::map<std::string, Entry>::iterator it) {
    auto c = byConn_.find(it->second.conn);
    if (c != byConn_.end()) {
        c->second.erase(it->first);
        if (c->second.empty()) byConn_.erase(c);
    }
    byOwner_.erase(it);
}

std::optional<json> ForceTable::forcedValue(const std::string& name) const {
    const Forced* best = nullptr;
    for (const auto& kv : byOwner_) {
        auto f = kv.second.values.find(name);
        if (f == kv.second.values.end()) continue;
        if (!best || f->second.seq > best->seq) best = &f->second;
    }
    if (!best) return std::nullopt;
    return best->value;
}

json ForceTable::snapshot() const {
    json out = json::array();
    for (const auto& kv : byOwner_) {
        for (const auto& v : kv.second.values) {
            out.push_back({{"owner_id", kv.first}, {"name", v.first}, {"value", v.second.value}});
        }
    }
    return out;
}

std::optional<ConnId> ForceTable::connectionOf(const std::string& owner) const {
    auto it = byOwner_.find(owner);
    if (it == byOwner_.end()) return std::nullopt;
    return it->second.conn;
}

std::vector<std::string> ForceTable::ownersOf(ConnId conn) const {
    auto c = byConn_.find(conn);
    if (c == byConn_.end()) return {};
    return std::vector<std::string>(c->second.begin(), c->second.end());
}

} // namespace lsim
