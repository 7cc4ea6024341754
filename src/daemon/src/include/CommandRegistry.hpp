/*
 * LocalSim runtime - Command registry (dispatcher table)
 * (c) 2025 LocalSim contributors
 */
#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Protocol.hpp"

namespace lsim {

/* Lightweight command metadata. */
struct CommandInfo {
    std::string name;
    std::string help;   // short description (one line)
};

/* Error thrown when a command is not found. */
class CommandNotFound : public std::runtime_error {
public:
    explicit CommandNotFound(const std::string& n)
        : std::runtime_error("Unknown cmd: " + n) {}
};

/*
 * Command registry.
 * - Stores name -> (Handler, help), exact string match on the name.
 * - Not locked: it is filled before the server starts and only used from
 *   the connection loop thread afterwards.
 */
class CommandRegistry {
public:
    using Handler = std::function<Response(const Request&, Session&)>;

    CommandRegistry();
    ~CommandRegistry();

    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

    /* Register or replace a command. */
    void add(const std::string& name, const std::string& help, Handler fn);

    bool exists(const std::string& name) const;
    size_t size() const;

    /* Invoke a command; throws CommandNotFound if missing, lets handler exceptions through. */
    Response call(const Request& req, Session& session) const;

    /*
     * Invoke a command and apply the uniform envelope: unknown commands and
     * any std::exception raised by the handler become {ok:false, error}.
     */
    Response dispatch(const Request& req, Session& session) const;

    /* Commands in registration order. */
    std::vector<CommandInfo> list() const;

private:
    struct Impl;
    Impl* impl_;
};

} // namespace lsim
