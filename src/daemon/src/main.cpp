/*
 * LocalSim runtime - Daemon entry (main)
 * (c) 2025 LocalSim contributors
 */

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include "include/Version.hpp"
#include "include/Config.hpp"
#include "include/Daemon.hpp"
#include "include/CommandRegistry.hpp"
#include "include/Log.hpp"
#include "include/Runtime.hpp"
#include "rpc/RpcHandlers.hpp"

using lsim::Daemon;
using lsim::RuntimeConfig;

namespace {

// Exit codes; 2 tells operators another instance already holds the port.
constexpr int kExitOk         = 0;
constexpr int kExitFailure    = 1;
constexpr int kExitBindFailed = 2;

std::atomic<bool> gStop{false};
void sig_handler(int) { gStop.store(true); }

void usage(const char* exe) {
    std::cout <<
        "LocalSim runtime (localsimd) " << LSIMD_VERSION << "\n"
        "Usage: " << exe << " [options]\n"
        "Options:\n"
        "  --config PATH      JSON config file (keys: host, port, logfile, logLevel, maxFrameBytes, scanMs)\n"
        "  --host IP          Bind host (default: 127.0.0.1)\n"
        "  --port N           Bind port (default: 1963)\n"
        "  --log LEVEL        ERROR|WARN|INFO|DEBUG|TRACE (default: INFO)\n"
        "  --logfile PATH     Also append log lines to PATH\n"
        "  --scan-ms V        Nominal simulated scan time in ms (default: 10)\n"
        "  --debug            Same as --log DEBUG\n"
        "  --quiet            Do not mirror log lines to stdout/stderr\n"
        "  --cmds             Print the command table and exit (no sockets)\n"
        "  -h,--help          Show this help\n";
}

void print_commands_pretty(const lsim::CommandRegistry& reg) {
    const auto entries = reg.list();
    std::fprintf(stdout, "Commands (%zu):\n", entries.size());
    for (const auto& e : entries) {
        std::fprintf(stdout, "  %-14s  %s\n", e.name.c_str(), e.help.c_str());
    }
}

void install_signals() {
    std::signal(SIGINT,  sig_handler);
    std::signal(SIGTERM, sig_handler);
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

} // namespace

int main(int argc, char** argv) {
    std::string cfgPath;
    std::string host, port, logLevel, logFile, scanMs;
    bool debug = false;
    bool quiet = false;
    bool listCmds = false;

    // Parse CLI first (no filesystem/config yet)
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](const char* what) -> std::string {
            if (i + 1 >= argc) { std::cerr << "missing value for " << what << "\n"; std::exit(kExitFailure); }
            return argv[++i];
        };
        if (a == "--config")       cfgPath  = next(a.c_str());
        else if (a == "--host")    host     = next(a.c_str());
        else if (a == "--port")    port     = next(a.c_str());
        else if (a == "--log")     logLevel = next(a.c_str());
        else if (a == "--logfile") logFile  = next(a.c_str());
        else if (a == "--scan-ms") scanMs   = next(a.c_str());
        else if (a == "--debug")   debug = true;
        else if (a == "--quiet")   quiet = true;
        else if (a == "--cmds")    listCmds = true;
        else if (a == "-h" || a == "--help") { usage(argv[0]); return kExitOk; }
        else {
            std::cerr << "unknown arg: " << a << "\n";
            usage(argv[0]);
            return kExitFailure;
        }
    }

    // --cmds: list commands WITHOUT touching config or sockets.
    if (listCmds) {
        lsim::Runtime rt;
        lsim::CommandRegistry reg;
        lsim::BindRuntimeRpcCommands(rt, reg);
        print_commands_pretty(reg);
        return kExitOk;
    }

    // Defaults -> ENV -> config file
    std::string loadErr;
    RuntimeConfig cfg = lsim::loadRuntimeConfig(cfgPath, &loadErr);
    if (!loadErr.empty()) {
        std::cerr << "config: " << loadErr << "\n";
        return kExitFailure;
    }

    // -> CLI flags
    try {
        if (!host.empty())   cfg.host = host;
        if (!port.empty())   cfg.port = std::stoi(port);
        if (!scanMs.empty()) cfg.scanMs = std::stod(scanMs);
    } catch (const std::exception&) {
        std::cerr << "invalid numeric option\n";
        return kExitFailure;
    }
    if (!logLevel.empty()) cfg.logLevel = logLevel;
    if (!logFile.empty())  cfg.logfile  = logFile;
    if (debug)             cfg.logLevel = "debug";

    const std::string invalid = lsim::validateConfig(cfg);
    if (!invalid.empty()) {
        std::cerr << "config: " << invalid << "\n";
        return kExitFailure;
    }

    lsim::LogLevel lvl = lsim::LogLevel::Info;
    if (!lsim::parseLogLevel(cfg.logLevel, lvl)) {
        std::cerr << "unknown log level: " << cfg.logLevel << "\n";
        return kExitFailure;
    }
    lsim::Logger::instance().init(cfg.logfile, lvl, !quiet);
    LOG_INFO("localsimd starting (version %s, protocol %s)", LSIMD_VERSION, LSIM_PROTOCOL);
    if (!cfg.configFile.empty()) {
        LOG_INFO("config: %s", cfg.configFile.c_str());
    }

    install_signals();

    Daemon daemon(cfg);
    switch (daemon.init()) {
        case Daemon::InitResult::Ok:
            break;
        case Daemon::InitResult::BindFailed:
            lsim::Logger::instance().shutdown();
            return kExitBindFailed;
        case Daemon::InitResult::Failed:
            LOG_ERROR("daemon init failed");
            lsim::Logger::instance().shutdown();
            return kExitFailure;
    }

    // Main thread waits for a signal or a SHUTDOWN command; the server thread owns the state.
    daemon.runLoop(gStop);

    if (gStop.load()) {
        LOG_INFO("localsimd shutting down (signal received)");
    }
    daemon.shutdown();

    lsim::Logger::instance().shutdown();
    return kExitOk;
}
