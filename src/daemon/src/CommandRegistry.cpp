/*
 * LocalSim runtime - Command registry (implementation)
 * (c) 2025 LocalSim contributors
 */
#include "include/CommandRegistry.hpp"
#include "include/Log.hpp"

#include <unordered_map>
#include <utility>

namespace lsim {

struct CommandRegistry::Impl {
    struct Entry {
        CommandRegistry::Handler fn;
        std::string help;
    };
    std::unordered_map<std::string, Entry> map;
    std::vector<std::string> order;
};

CommandRegistry::CommandRegistry()
    : impl_(new Impl) {}

CommandRegistry::~CommandRegistry() {
    delete impl_;
}

void CommandRegistry::add(const std::string& name, const std::string& helpText, Handler fn) {
    auto it = impl_->map.find(name);
    if (it == impl_->map.end()) {
        impl_->order.push_back(name);
        impl_->map.emplace(name, Impl::Entry{std::move(fn), helpText});
    } else {
        it->second = Impl::Entry{std::move(fn), helpText};
    }
}

bool CommandRegistry::exists(const std::string& name) const {
    return impl_->map.find(name) != impl_->map.end();
}

size_t CommandRegistry::size() const {
    return impl_->map.size();
}

Response CommandRegistry::call(const Request& req, Session& session) const {
    auto it = impl_->map.find(req.cmd);
    if (it == impl_->map.end()) {
        throw CommandNotFound(req.cmd);
    }
    return it->second.fn(req, session);
}

Response CommandRegistry::dispatch(const Request& req, Session& session) const {
    try {
        return call(req, session);
    } catch (const CommandNotFound& ex) {
        LOG_DEBUG("rpc: conn=%llu unknown cmd '%s'",
                  static_cast<unsigned long long>(session.connId), req.cmd.c_str());
        return Response::makeError(req.reqId, ex.what());
    } catch (const std::exception& ex) {
        LOG_DEBUG("rpc: conn=%llu cmd '%s' failed: %s",
                  static_cast<unsigned long long>(session.connId), req.cmd.c_str(), ex.what());
        return Response::makeError(req.reqId, ex.what());
    }
}

std::vector<CommandInfo> CommandRegistry::list() const {
    std::vector<CommandInfo> out;
    out.reserve(impl_->order.size());
    for (const auto& name : impl_->order) {
        out.push_back(CommandInfo{name, impl_->map.at(name).help});
    }
    return out;
}

} // namespace lsim
