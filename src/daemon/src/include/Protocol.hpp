/*
 * LocalSim runtime - Request/response envelope
 * (c) 2025 LocalSim contributors
 */
#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace lsim {

/* Wire request: {"cmd": string, "req_id": integer, "payload": object} */
struct Request {
    std::string    cmd;
    nlohmann::json reqId;     // integer, echoed verbatim (keeps signedness)
    nlohmann::json payload;   // always an object after parseRequest()
};

/* Wire response: {"ok": bool, "req_id": integer, "payload": object, "error": string} */
struct Response {
    bool           ok{true};
    nlohmann::json reqId{-1};
    nlohmann::json payload{nlohmann::json::object()};
    std::string    error;

    static inline Response makeOk(const nlohmann::json& reqId, nlohmann::json payload) {
        Response r; r.ok = true; r.reqId = reqId; r.payload = std::move(payload); return r;
    }

    static inline Response makeError(const nlohmann::json& reqId, const std::string& msg) {
        Response r; r.ok = false; r.reqId = reqId; r.error = msg; return r;
    }

    inline nlohmann::json toJson() const {
        return nlohmann::json{
            {"ok",      ok},
            {"req_id",  reqId},
            {"payload", payload.is_object() ? payload : nlohmann::json::object()},
            {"error",   error}
        };
    }
};

// --- convenience helpers shared by all Rpc*.cpp -----------------------------
inline Response ok_(const Request& rq, nlohmann::json payload = nlohmann::json::object()) {
    return Response::makeOk(rq.reqId, std::move(payload));
}

inline Response err_(const Request& rq, const std::string& message) {
    return Response::makeError(rq.reqId, message);
}

/*
 * Per-connection context handed to every handler.
 * Handlers only set the flags; the connection loop acts on them after the
 * response has been queued.
 */
struct Session {
    std::uint64_t connId{0};
    std::string   peer;

    bool closeAfterReply{false};   // stop reading, flush, then close
    bool shutdownServer{false};    // stop accepting new connections
};

/*
 * Validate the envelope of a decoded frame.
 * On failure returns false; `echoId` is the integer req_id when one was
 * present, otherwise -1, and `err` is the message to send back.
 * A missing or null payload is accepted as {}.
 */
bool parseRequest(const nlohmann::json& msg, Request& out, nlohmann::json& echoId, std::string& err);

} // namespace lsim
