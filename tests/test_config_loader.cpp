#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "config_loader.h"

using scribble::AppConfig;
using scribble::AppConfigManager;

namespace {

class ConfigFile : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = (std::filesystem::temp_directory_path() /
                 ("scribble_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".cfg"))
                    .string();
        unsetenv("SCRIBBLE_MAX_VERTICES");
        unsetenv("SCRIBBLE_VALIDATION");
    }

    void TearDown() override {
        std::remove(path_.c_str());
        unsetenv("SCRIBBLE_MAX_VERTICES");
        unsetenv("SCRIBBLE_VALIDATION");
    }

    void write(const std::string& text) {
        std::ofstream out(path_, std::ios::trunc);
        out << text;
    }

    std::string path_;
};

}

TEST(AppConfig, EmbeddedDefaults) {
    AppConfig cfg;
    EXPECT_EQ(cfg.window_title, "Scribble");
    EXPECT_EQ(cfg.window_width, 1024);
    EXPECT_EQ(cfg.window_height, 768);
    EXPECT_FALSE(cfg.validation_enabled);
    EXPECT_EQ(cfg.max_frames_in_flight, 2);
    EXPECT_EQ(cfg.max_vertices, 262144u);
    EXPECT_EQ(cfg.staging_buffer_vertex_count, 4096u);
    EXPECT_EQ(cfg.fence_timeout_ms, 5000u);
}

TEST_F(ConfigFile, MissingFileKeepsDefaults) {
    AppConfigManager mgr;
    mgr.set_cli_config_path(path_ + ".does-not-exist");
    mgr.reload();
    EXPECT_FALSE(mgr.has_config_file());
    AppConfig expected;
    expected.config_path = path_ + ".does-not-exist";
    EXPECT_EQ(mgr.active(), expected);
}

TEST_F(ConfigFile, DottedKeysOverrideDefaults) {
    write("# comment\n"
          "window.title=Sketch\n"
          "window.width = 640\n"
          "vulkan.max_vertices=1000\n"
          "vulkan.staging_buffer_vertex_count=64\n"
          "shaders.vertex=custom/line.vert.spv\n"
          "log.stream=yes\n");
    AppConfigManager mgr;
    mgr.set_cli_config_path(path_);
    mgr.reload();

    const AppConfig& cfg = mgr.active();
    EXPECT_TRUE(mgr.has_config_file());
    EXPECT_EQ(cfg.window_title, "Sketch");
    EXPECT_EQ(cfg.window_width, 640);
    EXPECT_EQ(cfg.window_height, 768);
    EXPECT_EQ(cfg.max_vertices, 1000u);
    EXPECT_EQ(cfg.staging_buffer_vertex_count, 64u);
    EXPECT_EQ(cfg.vertex_shader, "custom/line.vert.spv");
    EXPECT_TRUE(cfg.log_stream);
}

TEST_F(ConfigFile, SectionHeadersPrefixKeys) {
    write("[vulkan]\n"
          "max_frames_in_flight = 3\n"
          "validation_enabled = true\n"
          "[window]\n"
          "title = \"Quoted Title\"\n");
    AppConfigManager mgr;
    mgr.set_cli_config_path(path_);
    mgr.reload();
    EXPECT_EQ(mgr.active().max_frames_in_flight, 3);
    EXPECT_TRUE(mgr.active().validation_enabled);
    EXPECT_EQ(mgr.active().window_title, "Quoted Title");
}

TEST_F(ConfigFile, MalformedValuesAreIgnored) {
    write("window.width=wide\n"
          "vulkan.max_vertices=\n"
          "window.height=500\n"
          "unknown.key=1\n");
    AppConfigManager mgr;
    mgr.set_cli_config_path(path_);
    mgr.reload();
    EXPECT_EQ(mgr.active().window_width, 1024);
    EXPECT_EQ(mgr.active().max_vertices, 262144u);
    EXPECT_EQ(mgr.active().window_height, 500);
}

TEST_F(ConfigFile, EnvironmentWinsOverFile) {
    write("vulkan.max_vertices=1000\n");
    setenv("SCRIBBLE_MAX_VERTICES", "2048", 1);
    setenv("SCRIBBLE_VALIDATION", "on", 1);
    AppConfigManager mgr;
    mgr.set_cli_config_path(path_);
    mgr.reload();
    EXPECT_EQ(mgr.file_layer().max_vertices, 1000u);
    EXPECT_EQ(mgr.active().max_vertices, 2048u);
    EXPECT_TRUE(mgr.active().validation_enabled);
}

TEST_F(ConfigFile, CountsAreAtLeastOne) {
    write("vulkan.max_frames_in_flight=0\n"
          "vulkan.staging_buffer_vertex_count=0\n");
    AppConfigManager mgr;
    mgr.set_cli_config_path(path_);
    mgr.reload();
    EXPECT_EQ(mgr.active().max_frames_in_flight, 1);
    EXPECT_EQ(mgr.active().staging_buffer_vertex_count, 1u);
}

TEST_F(ConfigFile, SavedConfigLoadsBackIdentically) {
    write("window.title=Saved\nvulkan.max_vertices=777\n");
    AppConfigManager first;
    first.set_cli_config_path(path_);
    first.reload();
    first.override_validation(true);
    ASSERT_TRUE(first.save_active_to_file());

    AppConfigManager second;
    second.set_cli_config_path(path_);
    second.reload();
    EXPECT_EQ(second.active(), first.active());
}

TEST_F(ConfigFile, ReloadReportsChanges) {
    write("window.width=800\n");
    AppConfigManager mgr;
    mgr.set_cli_config_path(path_);
    EXPECT_TRUE(mgr.reload());
    EXPECT_FALSE(mgr.reload());
    write("window.width=900\n");
    EXPECT_TRUE(mgr.reload());
    EXPECT_EQ(mgr.active().window_width, 900);
}
