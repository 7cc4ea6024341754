/*
 * LocalSim runtime - Utility helpers (header)
 * (c) 2025 LocalSim contributors
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json_fwd.hpp>

struct sockaddr_storage;

namespace lsim { namespace util {

/* ----------------------------------------------------------------------------
 * Environment helpers
 * ----------------------------------------------------------------------------*/

std::optional<std::string> getenv_str(const char* key);

/* ----------------------------------------------------------------------------
 * String helpers
 * ----------------------------------------------------------------------------*/

std::string trim(std::string_view sv);

/** Lowercase copy (ASCII) */
std::string to_lower(std::string_view sv);

/** Case-insensitive (ASCII) suffix test. */
bool iends_with(std::string_view s, std::string_view suffix);

/* ----------------------------------------------------------------------------
 * Time helpers
 * ----------------------------------------------------------------------------*/

/** "YYYY-MM-DDTHH:MM:SSZ" */
std::string utc_iso8601();

/* ----------------------------------------------------------------------------
 * Filesystem helpers
 * ----------------------------------------------------------------------------*/

/** Ensure parent directory of path exists (no-op if already exists). */
void ensure_parent_dirs(const std::filesystem::path& p, std::error_code* ec = nullptr);

/** Read and parse a JSON file; throws std::runtime_error on I/O or parse failure. */
nlohmann::json read_json_file(const std::filesystem::path& p);

/* Expand a user/home/environment path:
 *  - Leading '~' -> $HOME
 *  - ${VAR} or $VAR -> environment variable
 * Returns the expanded string (no filesystem checks). */
std::string expandUserPath(const std::string& path);

/* ----------------------------------------------------------------------------
 * Socket helpers
 * ----------------------------------------------------------------------------*/

/** "ip:port" for an accepted peer (IPv4/IPv6), "?" when unknown. */
std::string peerToString(const sockaddr_storage& ss);

}} // namespace lsim::util
