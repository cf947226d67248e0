#pragma once

#include <string>
#include <vector>

#include "platform_input.h"

struct GLFWwindow;

namespace scribble {

// GLFW window whose callbacks queue PlatformEvents until drained.
class WindowInput {
public:
    WindowInput() = default;
    ~WindowInput();

    WindowInput(const WindowInput&) = delete;
    WindowInput& operator=(const WindowInput&) = delete;

    void initialize(int width, int height, const std::string& title);
    void shutdown();

    GLFWwindow* handle() const { return window_; }

    void poll_events() const;
    // Blocks until at least one event arrives.
    void wait_events() const;
    bool should_close() const;
    void request_close();

    // Moves the queued events into out and clears the queue.
    void drain_events(std::vector<PlatformEvent>& out);

    void get_window_size(int& width, int& height) const;
    void get_framebuffer_size(int& width, int& height) const;

private:
    void push(const PlatformEvent& event) { events_.push_back(event); }

    static WindowInput* from(GLFWwindow* window);
    static void on_cursor_pos(GLFWwindow* window, double x, double y);
    static void on_mouse_button(GLFWwindow* window, int button, int action, int mods);
    static void on_key(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void on_window_size(GLFWwindow* window, int width, int height);
    static void on_framebuffer_size(GLFWwindow* window, int width, int height);

    GLFWwindow* window_ = nullptr;
    std::vector<PlatformEvent> events_;
    double cursor_x_ = 0.0;
    double cursor_y_ = 0.0;
};

} // namespace scribble
