#include "config/config.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace voxcall;
namespace fs = std::filesystem;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / ("voxcall_config_test_" + std::to_string(::getpid()));
        fs::create_directories(dir);
        ::unsetenv("VOXCALL_WS_URL");
        ::unsetenv("VOXCALL_API_URL");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
        ::unsetenv("VOXCALL_WS_URL");
        ::unsetenv("VOXCALL_API_URL");
    }

    std::string writeFile(const std::string& contents) {
        auto path = dir / "voxcall.toml";
        std::ofstream out(path);
        out << contents;
        return path.string();
    }
};

} // namespace

TEST_F(ConfigTest, MissingFileLeavesEverythingUnset) {
    FileConfig file = load_config_file((dir / "absent.toml").string());
    EXPECT_FALSE(file.server_url);
    EXPECT_FALSE(file.sample_rate);
    EXPECT_FALSE(file.journal);
}

TEST_F(ConfigTest, ParsesKeysCommentsAndQuotes) {
    auto path = writeFile(
        "# voxcall settings\n"
        "[voxcall]\n"
        "server_url = \"ws://10.0.0.2:9000/call#x\"  ; trailing comment\n"
        "api_url: http://10.0.0.2:9000\n"
        "device = 3\n"
        "output_device = 1\n"
        "sample_rate = 48000\n"
        "frame_ms = 100\n"
        "journal = no\n"
        "verbose = TRUE\n"
        "colour = blue\n");

    FileConfig file = load_config_file(path);
    EXPECT_EQ(file.server_url, "ws://10.0.0.2:9000/call#x");
    EXPECT_EQ(file.api_url, "http://10.0.0.2:9000");
    EXPECT_EQ(file.input_device, 3);
    EXPECT_EQ(file.output_device, 1);
    EXPECT_EQ(file.sample_rate, 48000);
    EXPECT_EQ(file.frame_ms, 100);
    EXPECT_EQ(file.journal, false);
    EXPECT_EQ(file.verbose, true);
}

TEST_F(ConfigTest, RejectsMalformedNumbers) {
    auto path = writeFile("sample_rate = 16k\nframe_ms = abc\ninput_device = 2\n");
    FileConfig file = load_config_file(path);
    EXPECT_FALSE(file.sample_rate);
    EXPECT_FALSE(file.frame_ms);
    EXPECT_EQ(file.input_device, 2);
}

TEST_F(ConfigTest, FileValuesOverrideDefaults) {
    AppConfig cfg;
    FileConfig file;
    file.server_url = "ws://example:1/call";
    file.sample_rate = 0;
    file.frame_ms = 120;
    file.journal = false;
    apply_file_config(cfg, file);

    EXPECT_EQ(cfg.server_url, "ws://example:1/call");
    EXPECT_EQ(cfg.api_url, "http://localhost:8000");
    EXPECT_EQ(cfg.sample_rate, 16000);
    EXPECT_EQ(cfg.frame_ms, 120);
    EXPECT_FALSE(cfg.journal);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    AppConfig cfg;
    cfg.server_url = "ws://from-file/call";
    ::setenv("VOXCALL_WS_URL", "ws://from-env/call", 1);
    ::setenv("VOXCALL_API_URL", "", 1);
    apply_environment(cfg);
    EXPECT_EQ(cfg.server_url, "ws://from-env/call");
    EXPECT_EQ(cfg.api_url, "http://localhost:8000");
}

TEST_F(ConfigTest, DefaultPathsFollowXdg) {
    ::setenv("XDG_CONFIG_HOME", "/tmp/cfg", 1);
    ::setenv("XDG_DATA_HOME", "/tmp/data", 1);
    EXPECT_EQ(default_config_path(), "/tmp/cfg/voxcall/voxcall.toml");
    EXPECT_EQ(default_db_path(), "/tmp/data/voxcall/voxcall.db");

    ::unsetenv("XDG_CONFIG_HOME");
    ::unsetenv("XDG_DATA_HOME");
    ::setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(default_config_path(), "/home/tester/.config/voxcall/voxcall.toml");
    EXPECT_EQ(default_db_path(), "/home/tester/.local/share/voxcall/voxcall.db");
}

TEST_F(ConfigTest, ExpandsHomeInPaths) {
    ::setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(expand_path("~/calls.db"), "/home/tester/calls.db");
    EXPECT_EQ(expand_path("/abs/calls.db"), "/abs/calls.db");
    EXPECT_EQ(expand_path("~other/x"), "~other/x");
}
