#include <gtest/gtest.h>
#include "config/config_loader.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <string>

using gamesmith::config::ExpandUserPath;
using gamesmith::config::LoadConfigFromFile;
using gamesmith::testing::TempDir;
using gamesmith::testing::WriteFile;

namespace {

const char* kManagedVariables[] = {
    "GAMESMITH_SANDBOX__INTERPRETER", "GAMESMITH_INTERPRETER",
    "GAMESMITH_SANDBOX__TIMEOUT_S", "GAMESMITH_TIMEOUT_S",
    "GAMESMITH_SANDBOX__SCRATCH_DIR", "GAMESMITH_SCRATCH_DIR",
    "GAMESMITH_STORAGE__OUTPUT_DIR", "GAMESMITH_OUTPUT_DIR",
    "GAMESMITH_LOGGING__LEVEL", "GAMESMITH_LOG_LEVEL",
};

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const auto* name : kManagedVariables) {
            ::unsetenv(name);
        }
        const char* home = std::getenv("HOME");
        saved_home_ = home ? home : "";
        ::setenv("HOME", home_.Path().c_str(), 1);
    }

    void TearDown() override {
        for (const auto* name : kManagedVariables) {
            ::unsetenv(name);
        }
        ::setenv("HOME", saved_home_.c_str(), 1);
    }

    TempDir home_;
    TempDir files_;
    std::string saved_home_;
};

}  // namespace

TEST_F(ConfigLoaderTest, MissingFile_YieldsDefaults) {
    const auto config = LoadConfigFromFile(files_.Path() / "absent.json");
    EXPECT_EQ(config.sandbox.interpreter, "python3");
    EXPECT_EQ(config.sandbox.timeout_s, 30);
    EXPECT_TRUE(config.sandbox.scratch_dir.empty());
    EXPECT_TRUE(config.sandbox.extra_env.empty());
    EXPECT_EQ(config.storage.output_dir, (home_.Path() / ".gamesmith/games").string());
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigLoaderTest, FileValuesAreApplied) {
    const auto path = files_.Path() / "config.json";
    WriteFile(path, R"({
        "sandbox": {
            "interpreter": "/usr/bin/python3.11",
            "timeoutS": 12,
            "scratchDir": "/tmp/gs-scratch",
            "extraEnv": {"LANG": "C.UTF-8", "IGNORED": 5}
        },
        "storage": {"outputDir": "~/sims"},
        "logging": {"level": "debug"}
    })");
    const auto config = LoadConfigFromFile(path);
    EXPECT_EQ(config.sandbox.interpreter, "/usr/bin/python3.11");
    EXPECT_EQ(config.sandbox.timeout_s, 12);
    EXPECT_EQ(config.sandbox.scratch_dir, "/tmp/gs-scratch");
    ASSERT_EQ(config.sandbox.extra_env.size(), 1u);
    EXPECT_EQ(config.sandbox.extra_env.at("LANG"), "C.UTF-8");
    EXPECT_EQ(config.storage.output_dir, (home_.Path() / "sims").string());
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigLoaderTest, WrongTypesAreIgnored) {
    const auto path = files_.Path() / "config.json";
    WriteFile(path, R"({"sandbox": {"timeoutS": "fast", "interpreter": 3}})");
    const auto config = LoadConfigFromFile(path);
    EXPECT_EQ(config.sandbox.timeout_s, 30);
    EXPECT_EQ(config.sandbox.interpreter, "python3");
}

TEST_F(ConfigLoaderTest, MalformedFile_KeepsDefaults) {
    const auto path = files_.Path() / "config.json";
    WriteFile(path, "{ not json");
    const auto config = LoadConfigFromFile(path);
    EXPECT_EQ(config.sandbox.timeout_s, 30);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const auto path = files_.Path() / "config.json";
    WriteFile(path, R"({"sandbox": {"timeoutS": 12}, "storage": {"outputDir": "/from/file"}})");
    ::setenv("GAMESMITH_SANDBOX__TIMEOUT_S", "45", 1);
    ::setenv("GAMESMITH_OUTPUT_DIR", "/from/env", 1);
    const auto config = LoadConfigFromFile(path);
    EXPECT_EQ(config.sandbox.timeout_s, 45);
    EXPECT_EQ(config.storage.output_dir, "/from/env");
}

TEST_F(ConfigLoaderTest, PrimaryEnvironmentNameWinsOverFallback) {
    ::setenv("GAMESMITH_SANDBOX__INTERPRETER", "pypy3", 1);
    ::setenv("GAMESMITH_INTERPRETER", "python3.12", 1);
    const auto config = LoadConfigFromFile(files_.Path() / "absent.json");
    EXPECT_EQ(config.sandbox.interpreter, "pypy3");
}

TEST_F(ConfigLoaderTest, NonPositiveTimeout_FallsBackToDefault) {
    ::setenv("GAMESMITH_TIMEOUT_S", "0", 1);
    EXPECT_EQ(LoadConfigFromFile(files_.Path() / "absent.json").sandbox.timeout_s, 30);
    ::setenv("GAMESMITH_TIMEOUT_S", "soon", 1);
    EXPECT_EQ(LoadConfigFromFile(files_.Path() / "absent.json").sandbox.timeout_s, 30);
}

TEST_F(ConfigLoaderTest, ExpandUserPath_OnlyTouchesLeadingTilde) {
    EXPECT_EQ(ExpandUserPath("~"), home_.Path().string());
    EXPECT_EQ(ExpandUserPath("~/games"), (home_.Path() / "games").string());
    EXPECT_EQ(ExpandUserPath("/srv/~/games"), "/srv/~/games");
    EXPECT_EQ(ExpandUserPath("relative/dir"), "relative/dir");
}
