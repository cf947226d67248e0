#pragma once

#include <cstdint>
#include <string>

namespace scribble {

struct AppConfig {
    std::string window_title = "Scribble";
    int window_width = 1024;
    int window_height = 768;

    bool validation_enabled = false;
    int max_frames_in_flight = 2;
    uint32_t max_vertices = 262144;
    uint32_t staging_buffer_vertex_count = 4096;
    uint32_t fence_timeout_ms = 5000;

    std::string vertex_shader = "shaders/line.vert.spv";
    std::string fragment_shader = "shaders/line.frag.spv";

    bool log_stream = false;

    std::string config_path = "scribble.cfg";
};

bool operator==(const AppConfig& a, const AppConfig& b);
bool operator!=(const AppConfig& a, const AppConfig& b);

// Defaults, then the key=value file, then SCRIBBLE_* environment variables.
class AppConfigManager {
public:
    explicit AppConfigManager(AppConfig defaults = AppConfig{});

    void set_cli_config_path(std::string path);

    bool reload();
    bool save_active_to_file();
    void override_validation(bool enabled);

    const AppConfig& defaults() const { return defaults_; }
    const AppConfig& file_layer() const { return after_file_; }
    const AppConfig& env_layer() const { return after_env_; }
    const AppConfig& active() const { return active_; }
    const std::string& config_path() const { return resolved_config_path_; }
    bool has_config_file() const { return file_layer_loaded_; }

private:
    bool apply_file_layer(AppConfig& cfg);
    void apply_env_layer(AppConfig& cfg);
    bool rebuild_active(const AppConfig& base);

    AppConfig defaults_{};
    AppConfig after_file_{};
    AppConfig after_env_{};
    AppConfig active_{};

    std::string cli_config_path_;
    std::string resolved_config_path_;
    bool file_layer_loaded_ = false;
};

} // namespace scribble
