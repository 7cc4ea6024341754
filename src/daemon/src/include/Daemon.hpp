/*
 * LocalSim runtime - Daemon (header)
 * - Owns the runtime state, the command table and the RPC server
 * (c) 2025 LocalSim contributors
 */
#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "Config.hpp"
#include "CommandRegistry.hpp"
#include "RpcTcpServer.hpp"
#include "Runtime.hpp"

namespace lsim {

class Daemon {
public:
    enum class InitResult {
        Ok,
        BindFailed,     // listen address busy/unavailable: another instance?
        Failed
    };

    explicit Daemon(const RuntimeConfig& cfg);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    /* Bind commands and start listening. */
    InitResult init();

    /* Block until SHUTDOWN has drained or `stopSignal` becomes true. */
    void runLoop(const std::atomic<bool>& stopSignal);

    /* Stop the server (idempotent); open sessions are closed and their forces purged. */
    void shutdown();

private:
    RuntimeConfig                 cfg_;
    Runtime                       runtime_;
    CommandRegistry               registry_;
    std::unique_ptr<RpcTcpServer> rpcServer_;
    std::atomic<bool>             running_{false};
};

} // namespace lsim
