/*
 * LocalSim runtime - RPC TCP Server (header)
 * Length-prefixed JSON over TCP, single-threaded select() loop.
 * (c) 2025 LocalSim contributors
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "Config.hpp"
#include "Framing.hpp"
#include "Protocol.hpp"

namespace lsim {

class CommandRegistry;
class Runtime;

/*
 * One loop thread owns every connection. Each readable socket is drained
 * into its FrameDecoder and complete frames are dispatched in arrival order;
 * responses are queued per connection and flushed when the socket is
 * writable. Command handlers run to completion between two select() calls,
 * so the Runtime never needs a lock.
 */
class RpcTcpServer {
public:
    RpcTcpServer(Runtime& rt, const std::string& host, unsigned short port,
                 std::uint32_t maxFrameBytes = kMaxFrameBytes);
    ~RpcTcpServer();

    RpcTcpServer(const RpcTcpServer&) = delete;
    RpcTcpServer& operator=(const RpcTcpServer&) = delete;

    /* Bind, listen and spawn the loop thread. On failure lastErrno() tells why. */
    bool start(const CommandRegistry* reg);

    /* Immediate stop: closes every connection (forces are purged) and joins. */
    void stop();

    /* Block until the loop has ended (after SHUTDOWN drained or stop()). */
    void wait();

    /* Loop has ended. */
    bool finished() const noexcept { return finished_.load(std::memory_order_acquire); }

    /* A SHUTDOWN command has been processed. */
    bool shutdownRequested() const noexcept { return shutdown_.load(std::memory_order_acquire); }

    /* Actual bound port (useful with port 0). */
    unsigned short port() const noexcept { return boundPort_.load(std::memory_order_acquire); }

    /* errno of the failing socket()/bind()/listen() call, 0 otherwise. */
    int lastErrno() const noexcept { return lastErrno_; }

private:
    struct Client {
        int          fd{-1};
        Session      session;
        FrameDecoder decoder;
        std::string  out;            // encoded responses
        std::size_t  outPos{0};      // bytes of `out` already written
        bool         eof{false};     // peer closed its side
        bool         closing{false}; // bad frame length: stop reading, flush, close
        bool         dead{false};    // socket failure: drop now

        std::size_t pending() const noexcept { return out.size() - outPos; }
    };

    bool openListener_();
    void loop_();
    void acceptClient_();
    void readClient_(Client& cl);
    void handleFrame_(Client& cl, const nlohmann::json& msg);
    void queue_(Client& cl, const Response& resp);
    void flushClient_(Client& cl);
    void closeClient_(std::map<int, Client>::iterator it, const char* reason);
    void closeListener_();

private:
    Runtime&       rt_;
    std::string    host_;
    unsigned short port_{0};
    std::uint32_t  maxFrameBytes_;

    const CommandRegistry* reg_{nullptr};

    std::atomic<bool>           running_{false};
    std::atomic<bool>           shutdown_{false};
    std::atomic<bool>           finished_{false};
    std::atomic<unsigned short> boundPort_{0};
    int                         lastErrno_{0};

    int           listenFd_{-1};
    std::thread   thr_;
    std::uint64_t nextConnId_{0};

    std::map<int, Client> clients_;
};

} // namespace lsim
