#include <gtest/gtest.h>
#include "../src/installer.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"
#include "../src/utils.hpp"
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

class InstallerTest : public ::testing::Test {
protected:
    fs::path env_dir;

    void SetUp() override {
        set_l10n_dir(PIPKIN_SOURCE_L10N_DIR);
        init_localization();
        env_dir = fs::absolute("tmp_installer_test_" + std::to_string(getpid()));
        fs::remove_all(env_dir);
        fs::create_directories(env_dir / "bin");
    }

    void TearDown() override {
        fs::remove_all(env_dir);
    }

    // Stands in for the environment's interpreter
    void write_python(const std::string& script) {
        const fs::path python = env_dir / "bin" / "python";
        write_file_bytes(python, "#!/bin/sh\n" + script);
        fs::permissions(python, fs::perms::owner_all);
    }
};

TEST_F(InstallerTest, VersionIsThePinnedOne) {
    PipInstaller installer("python3.99-not-installed");
    EXPECT_EQ(installer.version(), PINNED_PIP_VERSION);
}

TEST_F(InstallerTest, EnvironmentVersionComesFromEnvironmentPip) {
    write_python("echo \"pip 22.0.4 from $0 (python 3.11)\"\n");
    PipInstaller installer;
    EXPECT_EQ(installer.environment_version(env_dir), "22.0.4");
}

TEST_F(InstallerTest, EnvironmentVersionFailures) {
    PipInstaller installer;
    write_python("echo 'No module named pip' >&2\nexit 1\n");
    try {
        installer.environment_version(env_dir);
        FAIL() << "expected InstallerFailure";
    } catch (const InstallerFailure& e) {
        EXPECT_EQ(e.exit_status(), 1);
    }

    write_python("echo 'something else'\n");
    EXPECT_THROW(installer.environment_version(env_dir), InstallerFailure);
}

TEST_F(InstallerTest, EnvironmentDropsPipVariables) {
    Environment base = {{"PATH", "/usr/bin"}, {"PIP_INDEX_URL", "http://x"}, {"PIPX_HOME", "/p"}};
    Environment env = installer_environment(base, "/cache/pip");
    EXPECT_EQ(env.at("PATH"), "/usr/bin");
    EXPECT_EQ(env.at("PIPX_HOME"), "/p");
    EXPECT_FALSE(env.contains("PIP_INDEX_URL"));
    EXPECT_EQ(env.at("PIP_CACHE_DIR"), "/cache/pip");
}
