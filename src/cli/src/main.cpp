/*
 * LocalSim runtime - Command-line client (localsim-cli)
 * Sends one command and prints the response.
 * (c) 2025 LocalSim contributors
 */

#include <cstdlib>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "RuntimeClient.hpp"
#include "include/Version.hpp"

using nlohmann::json;

static void usage(const char* exe) {
    std::cout <<
        "LocalSim client " << LSIMD_VERSION << "\n"
        "Usage: " << exe << " [options]\n"
        "Options:\n"
        "  --host IP          Runtime host (default: 127.0.0.1)\n"
        "  --port N           Runtime port (default: 1963)\n"
        "  --timeout-ms N     Connect/read timeout (default: 2000)\n"
        "  --cmd NAME         Command to send (default: PING)\n"
        "  --payload JSON     Payload object (default: {})\n"
        "  -h,--help          Show this help\n"
        "Exit status: 0 ok, 1 runtime returned an error, 2 transport/usage error\n";
}

int main(int argc, char** argv) {
    std::string host = "127.0.0.1";
    int port = 1963;
    int timeoutMs = 2000;
    std::string cmd = "PING";
    std::string payloadText = "{}";

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](const char* what) -> std::string {
            if (i + 1 >= argc) { std::cerr << "missing value for " << what << "\n"; std::exit(2); }
            return argv[++i];
        };
        try {
            if (a == "--host")            host = next(a.c_str());
            else if (a == "--port")       port = std::stoi(next(a.c_str()));
            else if (a == "--timeout-ms") timeoutMs = std::stoi(next(a.c_str()));
            else if (a == "--cmd")        cmd = next(a.c_str());
            else if (a == "--payload")    payloadText = next(a.c_str());
            else if (a == "-h" || a == "--help") { usage(argv[0]); return 0; }
            else {
                std::cerr << "unknown arg: " << a << "\n";
                usage(argv[0]);
                return 2;
            }
        } catch (const std::exception&) {
            std::cerr << "invalid value for " << a << "\n";
            return 2;
        }
    }
    if (port <= 0 || port > 65535) {
        std::cerr << "port out of range\n";
        return 2;
    }

    json payload = json::parse(payloadText, nullptr, /*allow_exceptions=*/false);
    if (payload.is_discarded() || !payload.is_object()) {
        std::cerr << "--payload must be a JSON object\n";
        return 2;
    }

    try {
        lsim::RuntimeClient client;
        client.connect(host, static_cast<unsigned short>(port), timeoutMs);
        const json resp = client.call(cmd, payload);
        std::cout << resp.dump(2) << "\n";
        return resp.value("ok", false) ? 0 : 1;
    } catch (const lsim::ClientError& ex) {
        std::cerr << "error: " << ex.what() << "\n";
        return 2;
    }
}
