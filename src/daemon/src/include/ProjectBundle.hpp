/*
 * LocalSim runtime - Project bundle store
 * Holds the last bundle pushed with LOAD_PROJECT and its summary.
 * (c) 2025 LocalSim contributors
 */
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "Params.hpp"

namespace lsim {

/* Source files with this suffix (any case) are counted as st_files. */
constexpr const char* kSourceExtension = ".st";

struct ProjectBundle {
    nlohmann::json project;
    nlohmann::json pages;
    nlohmann::json vars;
    std::map<std::string, std::string> sources;   // relative path -> text
    nlohmann::json meta;
    std::string    receivedUtc;
};

struct ProjectSummary {
    std::string name;
    std::size_t pages{0};
    std::size_t sheets{0};
    std::size_t files{0};
    std::size_t stFiles{0};
    std::size_t bytes{0};
    std::string receivedUtc;

    nlohmann::json toJson() const;
};

/* Derive counts; malformed pages/sheets sub-structures contribute zero. */
ProjectSummary summarizeBundle(const ProjectBundle& b);

class ProjectStore {
public:
    /* Replace the stored bundle wholesale. `params` is already validated. */
    const ProjectSummary& load(LoadProjectParams params, const std::string& receivedUtc);

    bool loaded() const noexcept { return bundle_ != nullptr; }
    const ProjectBundle* bundle() const noexcept { return bundle_.get(); }

    /* {} before the first load. */
    nlohmann::json summaryJson() const;

private:
    std::unique_ptr<ProjectBundle> bundle_;
    ProjectSummary                 summary_;
};

} // namespace lsim
