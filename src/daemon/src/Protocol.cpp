/*
 * LocalSim runtime - Request/response envelope (implementation)
 * (c) 2025 LocalSim contributors
 */
#include "include/Protocol.hpp"

namespace lsim {

using nlohmann::json;

bool parseRequest(const json& msg, Request& out, json& echoId, std::string& err) {
    echoId = -1;
    if (!msg.is_object()) {
        err = "Invalid message schema";
        return false;
    }

    const auto itId = msg.find("req_id");
    const bool idOk = itId != msg.end() && itId->is_number_integer();
    if (idOk) echoId = *itId;

    const auto itCmd = msg.find("cmd");
    const bool cmdOk = itCmd != msg.end() && itCmd->is_string();

    json payload = json::object();
    bool payloadOk = true;
    const auto itPayload = msg.find("payload");
    if (itPayload != msg.end() && !itPayload->is_null()) {
        payloadOk = itPayload->is_object();
        if (payloadOk) payload = *itPayload;
    }

    if (!idOk || !cmdOk || !payloadOk) {
        err = "Invalid message schema";
        return false;
    }

    out.cmd     = itCmd->get<std::string>();
    out.reqId   = *itId;
    out.payload = std::move(payload);
    return true;
}

} // namespace lsim
