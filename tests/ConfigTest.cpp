#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

#include <unistd.h>

#include "include/Config.hpp"

using lsim::RuntimeConfig;

namespace {

const char* const kEnvKeys[] = {
    "LOCALSIM_HOST", "LOCALSIM_PORT", "LOCALSIM_LOG",
    "LOCALSIM_LOGFILE", "LOCALSIM_SCAN_MS", "LOCALSIM_MAX_FRAME"
};

class ConfigEnv : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* k : kEnvKeys) ::unsetenv(k);
    }
    void TearDown() override {
        for (const char* k : kEnvKeys) ::unsetenv(k);
        if (!tmpPath_.empty()) std::remove(tmpPath_.c_str());
    }

    std::string writeTemp(const std::string& text) {
        char tmpl[] = "/tmp/localsim-config-XXXXXX";
        const int fd = ::mkstemp(tmpl);
        if (fd >= 0) ::close(fd);
        tmpPath_ = tmpl;
        std::ofstream(tmpPath_) << text;
        return tmpPath_;
    }

    std::string tmpPath_;
};

} // namespace

TEST_F(ConfigEnv, DefaultsMatchTheDocumentedListener) {
    const RuntimeConfig c = lsim::loadRuntimeConfig("");
    EXPECT_EQ(c.host, "127.0.0.1");
    EXPECT_EQ(c.port, 1963);
    EXPECT_EQ(c.maxFrameBytes, lsim::kMaxFrameBytes);
    EXPECT_DOUBLE_EQ(c.scanMs, 10.0);
    EXPECT_TRUE(c.configFile.empty());
    EXPECT_EQ(lsim::validateConfig(c), "");
}

TEST_F(ConfigEnv, EnvironmentOverridesDefaults) {
    ::setenv("LOCALSIM_HOST", "0.0.0.0", 1);
    ::setenv("LOCALSIM_PORT", "20000", 1);
    ::setenv("LOCALSIM_SCAN_MS", "5.5", 1);
    ::setenv("LOCALSIM_LOG", "debug", 1);

    const RuntimeConfig c = lsim::loadRuntimeConfig("");
    EXPECT_EQ(c.host, "0.0.0.0");
    EXPECT_EQ(c.port, 20000);
    EXPECT_DOUBLE_EQ(c.scanMs, 5.5);
    EXPECT_EQ(c.logLevel, "debug");
}

TEST_F(ConfigEnv, UnparsableEnvironmentKeepsPreviousValue) {
    ::setenv("LOCALSIM_PORT", "not-a-port", 1);
    const RuntimeConfig c = lsim::loadRuntimeConfig("");
    EXPECT_EQ(c.port, 1963);
}

TEST_F(ConfigEnv, FileWinsOverEnvironment) {
    ::setenv("LOCALSIM_PORT", "20000", 1);
    ::setenv("LOCALSIM_HOST", "0.0.0.0", 1);
    const std::string path = writeTemp(R"({"port": 30000, "scanMs": 20})");

    const RuntimeConfig c = lsim::loadRuntimeConfig(path);
    EXPECT_EQ(c.port, 30000);
    EXPECT_EQ(c.host, "0.0.0.0");
    EXPECT_DOUBLE_EQ(c.scanMs, 20.0);
    EXPECT_EQ(c.configFile, path);
}

TEST_F(ConfigEnv, BrokenFileThrowsAndReportsThroughErr) {
    const std::string path = writeTemp("{ not json");
    EXPECT_THROW(lsim::loadRuntimeConfig(path), std::runtime_error);

    std::string err;
    const RuntimeConfig c = lsim::loadRuntimeConfig(path, &err);
    EXPECT_FALSE(err.empty());
    EXPECT_EQ(c.port, 1963);
}

TEST_F(ConfigEnv, WrongTypeInFileThrows) {
    const std::string path = writeTemp(R"({"port": "abc"})");
    EXPECT_THROW(lsim::loadRuntimeConfig(path), std::runtime_error);
}

TEST_F(ConfigEnv, MissingFileThrows) {
    EXPECT_THROW(lsim::loadRuntimeConfig("/nonexistent/localsim.json"), std::runtime_error);
}

TEST(ConfigValidate, RejectsOutOfRangeValues) {
    RuntimeConfig c;
    c.port = 70000;
    EXPECT_NE(lsim::validateConfig(c), "");

    c = RuntimeConfig{};
    c.host.clear();
    EXPECT_NE(lsim::validateConfig(c), "");

    c = RuntimeConfig{};
    c.scanMs = 0.0;
    EXPECT_NE(lsim::validateConfig(c), "");

    c = RuntimeConfig{};
    c.maxFrameBytes = lsim::kMaxFrameBytes + 1;
    EXPECT_NE(lsim::validateConfig(c), "");

    c = RuntimeConfig{};
    c.port = 0;
    EXPECT_EQ(lsim::validateConfig(c), "");
}
