/*
 * LocalSim runtime - Project bundle store (implementation)
 * (c) 2025 LocalSim contributors
 */
#include "include/ProjectBundle.hpp"
#include "include/Utils.hpp"

#include <utility>

namespace lsim {

using nlohmann::json;

json ProjectSummary::toJson() const {
    return json{
        {"name",         name},
        {"pages",        pages},
        {"sheets",       sheets},
        {"files",        files},
        {"st_files",     stFiles},
        {"bytes",        bytes},
        {"received_utc", receivedUtc}
    };
}

static std::size_t sheetCount_(const json& page) {
    if (!page.is_object()) return 0;
    auto it = page.find("sheets");
    if (it == page.end() || !it->is_array()) return 0;
    return it->size();
}

ProjectSummary summarizeBundle(const ProjectBundle& b) {
    ProjectSummary s;
    s.receivedUtc = b.receivedUtc;

    if (b.project.is_object()) {
        auto n = b.project.find("name");
        if (n != b.project.end() && !n->is_null()) {
            s.name = n->is_string() ? n->get<std::string>() : n->dump();
        }
    }

    if (b.pages.is_object()) {
        auto init = b.pages.find("init");
        if (init != b.pages.end() && init->is_object()) {
            s.pages  += 1;
            s.sheets += sheetCount_(*init);
        }
        auto list = b.pages.find("pages");
        if (list != b.pages.end() && list->is_array()) {
            s.pages += list->size();
            for (const auto& p : *list) s.sheets += sheetCount_(p);
        }
    }

    s.files = b.sources.size();
    for (const auto& kv : b.sources) {
        s.bytes += kv.second.size();
        if (util::iends_with(kv.first, kSourceExtension)) ++s.stFiles;
    }
    return s;
}

const ProjectSummary& ProjectStore::load(LoadProjectParams params, const std::string& receivedUtc) {
    auto next = std::make_unique<ProjectBundle>();
    next->project     = std::move(params.project);
    next->pages       = std::move(params.pages);
    next->vars        = std::move(params.vars);
    next->sources     = std::move(params.sources);
    next->meta        = std::move(params.meta);
    next->receivedUtc = receivedUtc;

    ProjectSummary summary = summarizeBundle(*next);

    // Nothing below can throw: bundle and summary are swapped together.
    bundle_.swap(next);
    summary_ = std::move(summary);
    return summary_;
}

json ProjectStore::summaryJson() const {
    if (!bundle_) return json::object();
    return summary_.toJson();
}

} // namespace lsim
