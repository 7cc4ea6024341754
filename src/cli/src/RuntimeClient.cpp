/*
 * LocalSim runtime - Synchronous protocol client (implementation)
 * (c) 2025 LocalSim contributors
 */
#include "RuntimeClient.hpp"

#include "include/Framing.hpp"

#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <string>

namespace lsim {

using nlohmann::json;

RuntimeClient::~RuntimeClient() {
    close();
}

void RuntimeClient::connect(const std::string& host, unsigned short port, int timeoutMs) {
    close();

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_NUMERICSERV;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    const int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        throw ClientError("cannot resolve " + host + ": " + ::gai_strerror(gai));
    }

    int lastErr = 0;
    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) { lastErr = errno; continue; }

        timeval tv{};
        tv.tv_sec  = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;
        (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd_ = fd;
            break;
        }
        lastErr = errno;
        ::close(fd);
    }
    ::freeaddrinfo(res);

    if (fd_ < 0) {
        throw ClientError("connect " + host + ":" + service + " failed: " + std::strerror(lastErr));
    }
}

void RuntimeClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void RuntimeClient::writeAll_(const char* src, std::size_t n) {
    if (fd_ < 0) throw ClientError("not connected");
    while (n > 0) {
        ssize_t w = ::send(fd_, src, n, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            throw ClientError(std::string("send failed: ") + std::strerror(errno));
        }
        src += w;
        n   -= static_cast<std::size_t>(w);
    }
}

void RuntimeClient::readExactly_(char* dst, std::size_t n) {
    if (fd_ < 0) throw ClientError("not connected");
    while (n > 0) {
        ssize_t r = ::recv(fd_, dst, n, 0);
        if (r == 0) throw ClientError("connection closed");
        if (r < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) throw ClientError("receive timeout");
            throw ClientError(std::string("recv failed: ") + std::strerror(errno));
        }
        dst += r;
        n   -= static_cast<std::size_t>(r);
    }
}

void RuntimeClient::sendRaw(const std::string& bytes) {
    writeAll_(bytes.data(), bytes.size());
}

void RuntimeClient::sendJson(const json& msg) {
    sendRaw(encodeFrame(msg));
}

std::int64_t RuntimeClient::send(const std::string& cmd, const json& payload) {
    const std::int64_t id = nextReqId_++;
    if (nextReqId_ > 2000000000) nextReqId_ = 1;
    sendJson(json{{"cmd", cmd}, {"req_id", id}, {"payload", payload}});
    return id;
}

json RuntimeClient::receive() {
    char hdr[kFrameHeaderSize];
    readExactly_(hdr, sizeof(hdr));
    const std::uint32_t len = readLengthLE(hdr);
    if (len == 0 || len > kMaxFrameBytes) {
        throw ClientError("invalid response length: " + std::to_string(len));
    }
    std::string body(len, '\0');
    readExactly_(&body[0], len);

    json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) throw ClientError("invalid JSON in response");
    return j;
}

json RuntimeClient::call(const std::string& cmd, const json& payload) {
    send(cmd, payload);
    return receive();
}

bool RuntimeClient::waitForClose(int timeoutMs) {
    if (fd_ < 0) return true;
    pollfd pfd{fd_, POLLIN, 0};
    int r = ::poll(&pfd, 1, timeoutMs);
    if (r <= 0) return false;
    char c;
    ssize_t n = ::recv(fd_, &c, 1, MSG_PEEK);
    return n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK);
}

} // namespace lsim
