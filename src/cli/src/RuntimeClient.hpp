/*
 * LocalSim runtime - Synchronous protocol client (header)
 * Used by localsim-cli and by the socket-level tests.
 * (c) 2025 LocalSim contributors
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "include/Config.hpp"

namespace lsim {

class ClientError : public std::runtime_error {
public:
    explicit ClientError(const std::string& what) : std::runtime_error(what) {}
};

/*
 * One blocking TCP connection. call() is send()+receive(); send() and
 * receive() can also be used separately to pipeline requests.
 * All transport failures throw ClientError.
 */
class RuntimeClient {
public:
    RuntimeClient() = default;
    ~RuntimeClient();

    RuntimeClient(const RuntimeClient&) = delete;
    RuntimeClient& operator=(const RuntimeClient&) = delete;

    void connect(const std::string& host, unsigned short port, int timeoutMs = 2000);
    void close();
    bool connected() const noexcept { return fd_ >= 0; }

    /* Request with the next req_id; returns the full response object. */
    nlohmann::json call(const std::string& cmd,
                        const nlohmann::json& payload = nlohmann::json::object());

    /* Sends {"cmd","req_id","payload"}; returns the req_id used. */
    std::int64_t send(const std::string& cmd,
                      const nlohmann::json& payload = nlohmann::json::object());

    /* Sends an arbitrary JSON value as one frame. */
    void sendJson(const nlohmann::json& msg);

    /* Sends raw bytes (tests: broken frames). */
    void sendRaw(const std::string& bytes);

    /* Reads one response frame. */
    nlohmann::json receive();

    /* True when the peer has closed the connection (waits up to timeoutMs). */
    bool waitForClose(int timeoutMs);

private:
    void readExactly_(char* dst, std::size_t n);
    void writeAll_(const char* src, std::size_t n);

    int          fd_{-1};
    std::int64_t nextReqId_{1};
};

} // namespace lsim
