#include <gtest/gtest.h>

#include "include/Params.hpp"
#include "include/ProjectBundle.hpp"

using nlohmann::json;
using lsim::LoadProjectParams;
using lsim::ParamError;
using lsim::ProjectStore;

namespace {

json samplePayload() {
    return json{
        {"project", {{"name", "Demo"}}},
        {"pages", {
            {"init", {{"sheets", json::array({json::object()})}}},
            {"pages", json::array({
                {{"sheets", json::array({json::object(), json::object()})}},
                {{"title", "no sheets"}}
            })}
        }},
        {"vars", {{"X", 0}}},
        {"sources", {{"main.st", "PROGRAM"}, {"lib/Util.ST", "FB"}, {"notes.txt", "hi"}}}
    };
}

} // namespace

TEST(ProjectBundle, SummaryCountsPagesSheetsAndFiles) {
    ProjectStore store;
    const auto& s = store.load(LoadProjectParams::fromJson(samplePayload()), "2025-01-01T00:00:00Z");

    EXPECT_EQ(s.name, "Demo");
    EXPECT_EQ(s.pages, 3u);
    EXPECT_EQ(s.sheets, 3u);
    EXPECT_EQ(s.files, 3u);
    EXPECT_EQ(s.stFiles, 2u);
    EXPECT_EQ(s.bytes, 7u + 2u + 2u);

    const json j = store.summaryJson();
    EXPECT_EQ(j.at("st_files"), 2);
    EXPECT_EQ(j.at("received_utc"), "2025-01-01T00:00:00Z");
}

TEST(ProjectBundle, BytesCountUtf8Encoding) {
    json p = samplePayload();
    p["sources"] = {{"a.st", "\xC3\xA9"}};
    ProjectStore store;
    EXPECT_EQ(store.load(LoadProjectParams::fromJson(p), "t").bytes, 2u);
}

TEST(ProjectBundle, MalformedPagesContributeZero) {
    json p = samplePayload();
    p["pages"] = {{"init", "oops"}, {"pages", {{"not", "an array"}}}};
    ProjectStore store;
    const auto& s = store.load(LoadProjectParams::fromJson(p), "t");
    EXPECT_EQ(s.pages, 0u);
    EXPECT_EQ(s.sheets, 0u);
}

TEST(ProjectBundle, SummaryIsEmptyBeforeFirstLoad) {
    ProjectStore store;
    EXPECT_FALSE(store.loaded());
    EXPECT_EQ(store.summaryJson(), json::object());
}

TEST(ProjectBundle, ValidationNamesTheOffendingField) {
    json p = samplePayload();
    p.erase("vars");
    try {
        LoadProjectParams::fromJson(p);
        FAIL() << "expected ParamError";
    } catch (const ParamError& e) {
        EXPECT_STREQ(e.what(), "payload.vars must be object");
    }

    p = samplePayload();
    p["sources"]["bad.st"] = 42;
    EXPECT_THROW(LoadProjectParams::fromJson(p), ParamError);

    p = samplePayload();
    p["meta"] = "text";
    EXPECT_THROW(LoadProjectParams::fromJson(p), ParamError);
}

TEST(ProjectBundle, SecondLoadReplacesWholesale) {
    ProjectStore store;
    store.load(LoadProjectParams::fromJson(samplePayload()), "t1");

    json p = samplePayload();
    p["project"] = {{"name", "Other"}};
    p["sources"] = json::object();
    const auto& s = store.load(LoadProjectParams::fromJson(p), "t2");
    EXPECT_EQ(s.name, "Other");
    EXPECT_EQ(s.files, 0u);
    EXPECT_TRUE(store.bundle()->sources.empty());
    EXPECT_EQ(store.bundle()->receivedUtc, "t2");
}
