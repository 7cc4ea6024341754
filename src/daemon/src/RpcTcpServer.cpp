/*
 * LocalSim runtime - RPC TCP Server (implementation)
 * (c) 2025 LocalSim contributors
 */
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "include/RpcTcpServer.hpp"
#include "include/CommandRegistry.hpp"
#include "include/Log.hpp"
#include "include/Runtime.hpp"
#include "include/Utils.hpp"

namespace lsim {

using nlohmann::json;

namespace {

// Stop reading from a peer while this much output is still queued.
constexpr std::size_t kMaxPendingOut = 4u * 1024u * 1024u;
constexpr std::size_t kRecvChunk     = 64u * 1024u;

inline void set_nonblock_(int fd) {
    int fl = ::fcntl(fd, F_GETFL, 0);
    if (fl < 0) return;
    (void)::fcntl(fd, F_SETFL, fl | O_NONBLOCK);
}

inline unsigned long long u64_(std::uint64_t v) { return static_cast<unsigned long long>(v); }

} // namespace

RpcTcpServer::RpcTcpServer(Runtime& rt, const std::string& host, unsigned short port,
                           std::uint32_t maxFrameBytes)
: rt_(rt), host_(host), port_(port), maxFrameBytes_(maxFrameBytes) {}

RpcTcpServer::~RpcTcpServer() {
    stop();
}

bool RpcTcpServer::openListener_() {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_PASSIVE | AI_NUMERICSERV;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port_);
    const int gai = ::getaddrinfo(host_.empty() ? nullptr : host_.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        LOG_ERROR("rpc: cannot resolve '%s': %s", host_.c_str(), ::gai_strerror(gai));
        lastErrno_ = EINVAL;
        return false;
    }

    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            lastErrno_ = errno;
            continue;
        }
        int one = 1;
        (void)::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        if (::bind(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
            lastErrno_ = errno;
            LOG_ERROR("rpc: bind(%s:%u) failed: %s", host_.c_str(), port_, std::strerror(lastErrno_));
            ::close(fd);
            continue;
        }
        if (::listen(fd, 16) < 0) {
            lastErrno_ = errno;
            LOG_ERROR("rpc: listen() failed: %s", std::strerror(lastErrno_));
            ::close(fd);
            continue;
        }

        sockaddr_storage ss{};
        socklen_t sl = sizeof(ss);
        unsigned short actual = port_;
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &sl) == 0) {
            if (ss.ss_family == AF_INET)
                actual = ntohs(reinterpret_cast<sockaddr_in*>(&ss)->sin_port);
            else if (ss.ss_family == AF_INET6)
                actual = ntohs(reinterpret_cast<sockaddr_in6*>(&ss)->sin6_port);
        }

        set_nonblock_(fd);
        listenFd_   = fd;
        lastErrno_  = 0;
        boundPort_.store(actual, std::memory_order_release);
        break;
    }
    ::freeaddrinfo(res);
    return listenFd_ >= 0;
}

bool RpcTcpServer::start(const CommandRegistry* reg) {
    if (running_.load()) return true;
    if (!reg) {
        LOG_ERROR("rpc: start without a command registry");
        return false;
    }
    reg_ = reg;

    if (!openListener_()) return false;

    shutdown_.store(false);
    finished_.store(false);
    running_.store(true);
    try {
        thr_ = std::thread([this]{ this->loop_(); });
    } catch (const std::exception& ex) {
        LOG_ERROR("rpc: failed to start thread: %s", ex.what());
        closeListener_();
        running_.store(false);
        return false;
    }

    LOG_INFO("rpc: listening on %s:%u", host_.c_str(), port());
    return true;
}

void RpcTcpServer::stop() {
    running_.store(false);
    if (thr_.joinable()) thr_.join();
    closeListener_();
}

void RpcTcpServer::wait() {
    if (thr_.joinable()) thr_.join();
}

void RpcTcpServer::closeListener_() {
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
    }
}

void RpcTcpServer::loop_() {
    while (running_.load()) {
        if (shutdown_.load() && listenFd_ >= 0) {
            closeListener_();
            LOG_INFO("rpc: listener closed, %zu connection(s) still open", clients_.size());
        }
        if (shutdown_.load() && clients_.empty()) break;

        fd_set rfds, wfds;
        FD_ZERO(&rfds);
        FD_ZERO(&wfds);

        int maxfd = -1;
        if (listenFd_ >= 0) {
            FD_SET(listenFd_, &rfds);
            maxfd = listenFd_;
        }
        for (const auto& kv : clients_) {
            const Client& cl = kv.second;
            const bool reading = !cl.eof && !cl.closing && !cl.session.closeAfterReply &&
                                 cl.pending() < kMaxPendingOut;
            const bool writing = cl.pending() > 0;
            if (reading) FD_SET(kv.first, &rfds);
            if (writing) FD_SET(kv.first, &wfds);
            if (reading || writing) maxfd = std::max(maxfd, kv.first);
        }

        timeval tv{0, 100 * 1000}; // 100ms tick to observe stop()
        int r = ::select(maxfd + 1, &rfds, &wfds, nullptr, &tv);
        if (r < 0) {
            if (errno == EINTR) continue;
            LOG_WARN("rpc: select() failed: %s", std::strerror(errno));
            continue;
        }

        if (listenFd_ >= 0 && FD_ISSET(listenFd_, &rfds)) {
            acceptClient_();
        }

        for (auto it = clients_.begin(); it != clients_.end(); ) {
            Client& cl = it->second;
            try {
                if (FD_ISSET(it->first, &rfds)) readClient_(cl);
                if (!cl.dead && cl.pending() > 0) flushClient_(cl);
            } catch (const std::exception& ex) {
                LOG_ERROR("rpc: conn=%llu (%s) failed: %s", u64_(cl.session.connId), cl.session.peer.c_str(), ex.what());
                cl.dead = true;
            }

            const bool drained = cl.pending() == 0 && (cl.eof || cl.closing || cl.session.closeAfterReply);
            if (cl.dead || drained) {
                auto victim = it++;
                closeClient_(victim, cl.dead ? "dropped" : "closed");
            } else {
                ++it;
            }
        }
    }

    while (!clients_.empty()) {
        closeClient_(clients_.begin(), "server stopping");
    }
    closeListener_();
    running_.store(false);
    finished_.store(true, std::memory_order_release);
    LOG_INFO("rpc: stopped");
}

void RpcTcpServer::acceptClient_() {
    sockaddr_storage cli{};
    socklen_t clilen = sizeof(cli);
    int cfd = ::accept(listenFd_, reinterpret_cast<sockaddr*>(&cli), &clilen);
    if (cfd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            LOG_WARN("rpc: accept() failed: %s", std::strerror(errno));
        }
        return;
    }
    if (cfd >= FD_SETSIZE) {
        LOG_WARN("rpc: rejecting connection, fd %d exceeds FD_SETSIZE", cfd);
        ::close(cfd);
        return;
    }
    set_nonblock_(cfd);

    Client cl{cfd, Session{}, FrameDecoder(maxFrameBytes_)};
    cl.session.connId = ++nextConnId_;
    cl.session.peer   = util::peerToString(cli);
    LOG_INFO("rpc: client connected %s (conn=%llu)", cl.session.peer.c_str(), u64_(cl.session.connId));

    clients_.emplace(cfd, std::move(cl));
}

void RpcTcpServer::readClient_(Client& cl) {
    char buf[kRecvChunk];
    ssize_t n = ::recv(cl.fd, buf, sizeof(buf), 0);
    if (n == 0) {
        cl.eof = true;
        return;
    }
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return;
        LOG_DEBUG("rpc: conn=%llu recv failed: %s", u64_(cl.session.connId), std::strerror(errno));
        cl.dead = true;
        return;
    }
    cl.decoder.feed(buf, static_cast<std::size_t>(n));

    // Frames after SHUTDOWN or a bad length on the same connection are discarded.
    while (!cl.session.closeAfterReply && !cl.closing) {
        json msg;
        std::string perr;
        switch (cl.decoder.next(msg, perr)) {
            case FrameDecoder::Status::NeedMore:
                return;
            case FrameDecoder::Status::Frame:
                handleFrame_(cl, msg);
                break;
            case FrameDecoder::Status::BadJson:
                LOG_WARN("rpc: conn=%llu bad JSON frame: %s", u64_(cl.session.connId), perr.c_str());
                queue_(cl, Response::makeError(-1, "JSON parse error: " + perr));
                break;
            case FrameDecoder::Status::Oversize:
            case FrameDecoder::Status::Empty:
                // Replies to the frames before it are still flushed.
                LOG_WARN("rpc: conn=%llu (%s) invalid frame length %u, closing",
                         u64_(cl.session.connId), cl.session.peer.c_str(), cl.decoder.declaredLength());
                cl.closing = true;
                return;
        }
    }
}

void RpcTcpServer::handleFrame_(Client& cl, const json& msg) {
    Request req;
    json echoId;
    std::string perr;
    if (!parseRequest(msg, req, echoId, perr)) {
        LOG_WARN("rpc: conn=%llu %s", u64_(cl.session.connId), perr.c_str());
        queue_(cl, Response::makeError(echoId, perr));
        return;
    }

    LOG_DEBUG("rpc: conn=%llu cmd='%s' req_id=%s",
              u64_(cl.session.connId), req.cmd.c_str(), req.reqId.dump().c_str());

    queue_(cl, reg_->dispatch(req, cl.session));

    if (cl.session.shutdownServer && !shutdown_.load()) {
        shutdown_.store(true, std::memory_order_release);
    }
}

void RpcTcpServer::queue_(Client& cl, const Response& resp) {
    if (cl.outPos > 0 && cl.outPos * 2 >= cl.out.size()) {
        cl.out.erase(0, cl.outPos);
        cl.outPos = 0;
    }
    try {
        cl.out += encodeFrame(resp.toJson(), maxFrameBytes_);
    } catch (const FramingError& ex) {
        LOG_WARN("rpc: conn=%llu response not sent: %s", u64_(cl.session.connId), ex.what());
        cl.out += encodeFrame(Response::makeError(resp.reqId, "Response too large").toJson(), maxFrameBytes_);
    }
}

void RpcTcpServer::flushClient_(Client& cl) {
    while (cl.pending() > 0) {
        ssize_t n = ::send(cl.fd, cl.out.data() + cl.outPos, cl.pending(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            if (errno == EINTR) continue;
            LOG_DEBUG("rpc: conn=%llu send failed: %s", u64_(cl.session.connId), std::strerror(errno));
            cl.dead = true;
            return;
        }
        cl.outPos += static_cast<std::size_t>(n);
    }
    cl.out.clear();
    cl.outPos = 0;
}

void RpcTcpServer::closeClient_(std::map<int, Client>::iterator it, const char* reason) {
    const Client& cl = it->second;

    // Forces never outlive the session that set them.
    const std::size_t cleared = rt_.forces().clearByConnection(cl.session.connId);
    if (cleared) {
        LOG_WARN("rpc: cleared %zu force owner(s) due to disconnect: %s", cleared, cl.session.peer.c_str());
    }

    ::close(it->first);
    LOG_INFO("rpc: client disconnected %s (conn=%llu, %s)",
             cl.session.peer.c_str(), u64_(cl.session.connId), reason);
    clients_.erase(it);
}

} // namespace lsim
