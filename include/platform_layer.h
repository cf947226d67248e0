#pragma once

#include <string>
#include <vector>

#include "platform_input.h"
#include "window_input.h"

struct GLFWwindow;

namespace scribble {

class PlatformLayer {
public:
    struct Config {
        int initial_width = 1024;
        int initial_height = 768;
        std::string title = "Scribble";
    };

    PlatformLayer() = default;
    ~PlatformLayer();

    void initialize(const Config& config);
    void shutdown();

    // Pumps the OS queue; with block set, sleeps until something arrives.
    void pump_events(bool block);
    const std::vector<PlatformEvent>& events() const { return events_; }

    bool should_close() const;
    void request_close();

    void get_window_size(int& width, int& height) const;
    void get_framebuffer_size(int& width, int& height) const;

    GLFWwindow* window_handle() const;

private:
    WindowInput window_;
    Config config_{};
    std::vector<PlatformEvent> events_;
    bool initialized_ = false;
};

} // namespace scribble
