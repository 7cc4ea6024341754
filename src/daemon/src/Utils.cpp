/*
 * LocalSim runtime - Utility helpers (implementation; POSIX)
 * (c) 2025 LocalSim contributors
 */

#include "include/Utils.hpp"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace lsim { namespace util {

using json = nlohmann::json;

/* ----------------------------------------------------------------------------
 * Environment helpers
 * ----------------------------------------------------------------------------*/

std::optional<std::string> getenv_str(const char* key) {
    if (!key || !*key) return std::nullopt;
    const char* v = std::getenv(key);
    if (!v) return std::nullopt;
    return std::string(v);
}

/* ----------------------------------------------------------------------------
 * String helpers
 * ----------------------------------------------------------------------------*/

std::string trim(std::string_view sv) {
    size_t i = 0, j = sv.size();
    while (i < j && std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(sv[j-1]))) --j;
    return std::string(sv.substr(i, j - i));
}

std::string to_lower(std::string_view sv) {
    std::string s(sv);
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool iends_with(std::string_view s, std::string_view suffix) {
    if (suffix.size() > s.size()) return false;
    return to_lower(s.substr(s.size() - suffix.size())) == to_lower(suffix);
}

/* ----------------------------------------------------------------------------
 * Time helpers
 * ----------------------------------------------------------------------------*/

std::string utc_iso8601()
{
    char buf[32] = {0};
    std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc) == 0) {
        return std::string();
    }
    return std::string(buf);
}

/* ----------------------------------------------------------------------------
 * Filesystem helpers
 * ----------------------------------------------------------------------------*/

void ensure_parent_dirs(const fs::path& p, std::error_code* ec) {
    fs::path dir = p.parent_path();
    if (dir.empty()) return;
    std::error_code tmp;
    fs::create_directories(dir, tmp);
    if (ec) *ec = tmp;
}

json read_json_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) {
        throw std::runtime_error("cannot open '" + p.string() + "'");
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    json j = json::parse(ss.str(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        throw std::runtime_error("invalid JSON in '" + p.string() + "'");
    }
    return j;
}

std::string expandUserPath(const std::string& in) {
    if (in.empty()) return in;

    std::string out = in;

    // "~" -> $HOME
    if (out.front() == '~') {
        auto home = getenv_str("HOME");
        if (home && !home->empty()) {
            if (out.size() == 1) return *home;
            if (out[1] == '/') out = *home + out.substr(1);
        }
    }

    // Expand $VAR and ${VAR}
    std::string result;
    result.reserve(out.size());
    for (size_t i = 0; i < out.size(); ++i) {
        const char c = out[i];
        if (c != '$' || i + 1 >= out.size()) {
            result.push_back(c);
            continue;
        }
        if (out[i + 1] == '{') {
            const size_t close = out.find('}', i + 2);
            if (close == std::string::npos) {
                result.append(out, i, std::string::npos);
                break;
            }
            auto v = getenv_str(out.substr(i + 2, close - (i + 2)).c_str());
            if (v) result += *v;
            i = close;
            continue;
        }
        size_t j = i + 1;
        while (j < out.size() && (std::isalnum(static_cast<unsigned char>(out[j])) || out[j] == '_')) ++j;
        if (j == i + 1) {
            result.push_back(c);
            continue;
        }
        auto v = getenv_str(out.substr(i + 1, j - (i + 1)).c_str());
        if (v) result += *v;
        i = j - 1;
    }
    return result;
}

/* ----------------------------------------------------------------------------
 * Socket helpers
 * ----------------------------------------------------------------------------*/

std::string peerToString(const sockaddr_storage& ss) {
    char host[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const auto* a = reinterpret_cast<const sockaddr_in*>(&ss);
        if (!::inet_ntop(AF_INET, &a->sin_addr, host, sizeof(host))) return "?";
        return std::string(host) + ":" + std::to_string(ntohs(a->sin_port));
    }
    if (ss.ss_family == AF_INET6) {
        const auto* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        if (!::inet_ntop(AF_INET6, &a->sin6_addr, host, sizeof(host))) return "?";
        return "[" + std::string(host) + "]:" + std::to_string(ntohs(a->sin6_port));
    }
    return "?";
}

}} // namespace lsim::util
