/*
 * LocalSim runtime - Daemon (implementation)
 * (c) 2025 LocalSim contributors
 */
#include "include/Daemon.hpp"
#include "include/Log.hpp"
#include "rpc/RpcHandlers.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

namespace lsim {

Daemon::Daemon(const RuntimeConfig& cfg)
: cfg_(cfg),
  runtime_(cfg.scanMs)
{
    BindRuntimeRpcCommands(runtime_, registry_);
}

Daemon::~Daemon() {
    shutdown();
}

Daemon::InitResult Daemon::init() {
    LOG_INFO("daemon: init start");

    rpcServer_ = std::make_unique<RpcTcpServer>(runtime_,
                     cfg_.host.empty() ? std::string("127.0.0.1") : cfg_.host,
                     static_cast<unsigned short>(cfg_.port),
                     cfg_.maxFrameBytes);
    if (!rpcServer_->start(&registry_)) {
        const int e = rpcServer_->lastErrno();
        rpcServer_.reset();
        if (e == EADDRINUSE || e == EADDRNOTAVAIL || e == EACCES) {
            LOG_ERROR("daemon: cannot bind %s:%d (%s): another instance running?",
                      cfg_.host.c_str(), cfg_.port, std::strerror(e));
            return InitResult::BindFailed;
        }
        LOG_ERROR("daemon: rpc server start failed");
        return InitResult::Failed;
    }

    running_.store(true, std::memory_order_relaxed);
    LOG_INFO("daemon: init done (rpc on %s:%u, scan %.1f ms)",
             cfg_.host.c_str(), rpcServer_->port(), cfg_.scanMs);
    return InitResult::Ok;
}

void Daemon::runLoop(const std::atomic<bool>& stopSignal) {
    LOG_INFO("daemon: runLoop enter");
    while (running_.load(std::memory_order_relaxed) &&
           !stopSignal.load(std::memory_order_relaxed) &&
           rpcServer_ && !rpcServer_->finished()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    if (rpcServer_ && rpcServer_->shutdownRequested()) {
        LOG_INFO("daemon: shutdown requested by client");
    }
    LOG_INFO("daemon: run loop end");
}

void Daemon::shutdown() {
    if (!running_.exchange(false)) return;
    LOG_INFO("daemon: shutdown");

    if (rpcServer_) {
        LOG_DEBUG("daemon: stopping rpc");
        rpcServer_->stop();
        rpcServer_.reset();
    }
    LOG_INFO("daemon: shutdown complete");
}

} // namespace lsim
