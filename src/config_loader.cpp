#include "config_loader.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <tuple>

namespace scribble {
namespace {

std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

bool parse_bool(std::string v, bool defv) {
    v = lower(trim(v));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return defv;
}

uint32_t parse_count(const std::string& v) {
    unsigned long parsed = std::stoul(v);
    return static_cast<uint32_t>(std::max(1ul, parsed));
}

const char* bool_string(bool v) {
    return v ? "true" : "false";
}

// Applies one dotted key. Returns false for keys this build does not know.
bool apply_key(const std::string& key, const std::string& val, AppConfig& cfg, const char* source) {
    if (key == "window.title") { cfg.window_title = val; std::cout << "[config] window.title=" << cfg.window_title << " (" << source << ")\n"; }
    else if (key == "window.width") { cfg.window_width = std::max(1, std::stoi(val)); std::cout << "[config] window.width=" << cfg.window_width << " (" << source << ")\n"; }
    else if (key == "window.height") { cfg.window_height = std::max(1, std::stoi(val)); std::cout << "[config] window.height=" << cfg.window_height << " (" << source << ")\n"; }
    else if (key == "vulkan.validation_enabled") { cfg.validation_enabled = parse_bool(val, cfg.validation_enabled); std::cout << "[config] vulkan.validation_enabled=" << bool_string(cfg.validation_enabled) << " (" << source << ")\n"; }
    else if (key == "vulkan.max_frames_in_flight") { cfg.max_frames_in_flight = std::max(1, std::stoi(val)); std::cout << "[config] vulkan.max_frames_in_flight=" << cfg.max_frames_in_flight << " (" << source << ")\n"; }
    else if (key == "vulkan.max_vertices") { cfg.max_vertices = parse_count(val); std::cout << "[config] vulkan.max_vertices=" << cfg.max_vertices << " (" << source << ")\n"; }
    else if (key == "vulkan.staging_buffer_vertex_count") { cfg.staging_buffer_vertex_count = parse_count(val); std::cout << "[config] vulkan.staging_buffer_vertex_count=" << cfg.staging_buffer_vertex_count << " (" << source << ")\n"; }
    else if (key == "vulkan.fence_timeout_ms") { cfg.fence_timeout_ms = parse_count(val); std::cout << "[config] vulkan.fence_timeout_ms=" << cfg.fence_timeout_ms << " (" << source << ")\n"; }
    else if (key == "shaders.vertex") { cfg.vertex_shader = val; std::cout << "[config] shaders.vertex=" << cfg.vertex_shader << " (" << source << ")\n"; }
    else if (key == "shaders.fragment") { cfg.fragment_shader = val; std::cout << "[config] shaders.fragment=" << cfg.fragment_shader << " (" << source << ")\n"; }
    else if (key == "log.stream") { cfg.log_stream = parse_bool(val, cfg.log_stream); std::cout << "[config] log.stream=" << bool_string(cfg.log_stream) << " (" << source << ")\n"; }
    else return false;
    return true;
}

void apply_checked(const std::string& key, const std::string& val, AppConfig& cfg, const char* source) {
    try {
        if (!apply_key(key, val, cfg, source)) {
            std::cout << "[config] unknown key " << key << " (" << source << ")\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "[config] ignoring " << key << "=" << val << " (" << source << "): " << e.what() << "\n";
    }
}

// Accepts flat "section.key=value" lines as well as "[section]" headers
// followed by "key = value", so a TOML-style file with scalar values loads too.
bool apply_file_overrides(const std::string& path, AppConfig& cfg) {
    if (path.empty()) {
        return false;
    }

    std::ifstream in(path);
    if (!in.good()) {
        std::cout << "[config] config file not found: " << path << " (using embedded defaults/env)\n";
        return false;
    }

    std::cout << "[config] reading " << path << "\n";

    std::string section;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.front() == '[' && line.back() == ']') {
            section = lower(trim(line.substr(1, line.size() - 2)));
            continue;
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = lower(trim(line.substr(0, eq)));
        std::string val = unquote(trim(line.substr(eq + 1)));
        if (key.find('.') == std::string::npos && !section.empty()) {
            key = section + "." + key;
        }
        apply_checked(key, val, cfg, "file");
    }

    return true;
}

void apply_env(const char* name, const char* key, AppConfig& cfg) {
    if (const char* s = std::getenv(name)) {
        apply_checked(key, s, cfg, "env");
    }
}

void apply_env_overrides(AppConfig& cfg) {
    apply_env("SCRIBBLE_WINDOW_TITLE", "window.title", cfg);
    apply_env("SCRIBBLE_WINDOW_WIDTH", "window.width", cfg);
    apply_env("SCRIBBLE_WINDOW_HEIGHT", "window.height", cfg);
    apply_env("SCRIBBLE_VALIDATION", "vulkan.validation_enabled", cfg);
    apply_env("SCRIBBLE_MAX_FRAMES_IN_FLIGHT", "vulkan.max_frames_in_flight", cfg);
    apply_env("SCRIBBLE_MAX_VERTICES", "vulkan.max_vertices", cfg);
    apply_env("SCRIBBLE_STAGING_BUFFER_VERTEX_COUNT", "vulkan.staging_buffer_vertex_count", cfg);
    apply_env("SCRIBBLE_FENCE_TIMEOUT_MS", "vulkan.fence_timeout_ms", cfg);
    apply_env("SCRIBBLE_VERTEX_SHADER", "shaders.vertex", cfg);
    apply_env("SCRIBBLE_FRAGMENT_SHADER", "shaders.fragment", cfg);
    apply_env("SCRIBBLE_LOG_STREAM", "log.stream", cfg);
}

void write_config_file(std::ostream& out, const AppConfig& cfg) {
    out << "# Scribble configuration\n";
    out << "# Generated at runtime -- feel free to edit\n\n";

    out << "window.title=" << cfg.window_title << '\n';
    out << "window.width=" << cfg.window_width << '\n';
    out << "window.height=" << cfg.window_height << '\n';

    out << "vulkan.validation_enabled=" << bool_string(cfg.validation_enabled) << '\n';
    out << "vulkan.max_frames_in_flight=" << cfg.max_frames_in_flight << '\n';
    out << "vulkan.max_vertices=" << cfg.max_vertices << '\n';
    out << "vulkan.staging_buffer_vertex_count=" << cfg.staging_buffer_vertex_count << '\n';
    out << "vulkan.fence_timeout_ms=" << cfg.fence_timeout_ms << '\n';

    out << "shaders.vertex=" << cfg.vertex_shader << '\n';
    out << "shaders.fragment=" << cfg.fragment_shader << '\n';

    out << "log.stream=" << bool_string(cfg.log_stream) << '\n';
}

auto tie_config(const AppConfig& c) {
    return std::tie(c.window_title, c.window_width, c.window_height,
                    c.validation_enabled, c.max_frames_in_flight, c.max_vertices,
                    c.staging_buffer_vertex_count, c.fence_timeout_ms,
                    c.vertex_shader, c.fragment_shader, c.log_stream, c.config_path);
}

} // namespace

bool operator==(const AppConfig& a, const AppConfig& b) {
    return tie_config(a) == tie_config(b);
}

bool operator!=(const AppConfig& a, const AppConfig& b) {
    return !(a == b);
}

AppConfigManager::AppConfigManager(AppConfig defaults)
    : defaults_(std::move(defaults)),
      after_file_(defaults_),
      after_env_(defaults_),
      active_(defaults_) {
    resolved_config_path_ = defaults_.config_path;
}

void AppConfigManager::set_cli_config_path(std::string path) {
    cli_config_path_ = std::move(path);
}

bool AppConfigManager::apply_file_layer(AppConfig& cfg) {
    if (apply_file_overrides(resolved_config_path_, cfg)) {
        file_layer_loaded_ = true;
        after_file_ = cfg;
        return true;
    }
    file_layer_loaded_ = false;
    after_file_ = defaults_;
    return false;
}

void AppConfigManager::apply_env_layer(AppConfig& cfg) {
    apply_env_overrides(cfg);
    after_env_ = cfg;
}

bool AppConfigManager::rebuild_active(const AppConfig& base) {
    bool changed = (active_ != base);
    active_ = base;
    if (changed) {
        std::cout << "[config] active configuration updated" << '\n';
    }
    return changed;
}

bool AppConfigManager::reload() {
    resolved_config_path_ = cli_config_path_.empty() ? defaults_.config_path : cli_config_path_;

    AppConfig merged = defaults_;
    if (!resolved_config_path_.empty()) {
        apply_file_layer(merged);
    } else {
        file_layer_loaded_ = false;
        after_file_ = defaults_;
    }

    apply_env_layer(merged);
    merged.config_path = resolved_config_path_.empty() ? defaults_.config_path : resolved_config_path_;
    return rebuild_active(merged);
}

bool AppConfigManager::save_active_to_file() {
    if (resolved_config_path_.empty()) {
        std::cout << "[config] cannot save: config_path is empty" << '\n';
        return false;
    }

    std::ofstream out(resolved_config_path_, std::ios::trunc);
    if (!out.good()) {
        std::cout << "[config] failed to write " << resolved_config_path_ << '\n';
        return false;
    }

    write_config_file(out, active_);
    out.flush();
    file_layer_loaded_ = true;
    after_file_ = active_;
    after_env_ = active_;
    std::cout << "[config] wrote " << resolved_config_path_ << '\n';
    return true;
}

void AppConfigManager::override_validation(bool enabled) {
    if (active_.validation_enabled == enabled) return;
    active_.validation_enabled = enabled;
    std::cout << "[config] vulkan.validation_enabled=" << bool_string(enabled) << " (cli)\n";
}

} // namespace scribble
