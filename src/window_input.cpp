#include "window_input.h"

#include <GLFW/glfw3.h>

#include <iostream>
#include <stdexcept>

namespace scribble {

namespace {
int g_glfw_init_count = 0;

void glfw_error(int code, const char* description) {
    std::cerr << "[app] GLFW error " << code << ": " << description << "\n";
}
}

WindowInput::~WindowInput() {
    shutdown();
}

void WindowInput::initialize(int width, int height, const std::string& title) {
    if (window_) {
        return;
    }

    if (g_glfw_init_count == 0) {
        glfwSetErrorCallback(glfw_error);
        if (!glfwInit()) {
            throw std::runtime_error("Failed to initialize GLFW");
        }
    }
    ++g_glfw_init_count;

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    window_ = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (!window_) {
        shutdown();
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwSetWindowUserPointer(window_, this);
    glfwSetCursorPosCallback(window_, &WindowInput::on_cursor_pos);
    glfwSetMouseButtonCallback(window_, &WindowInput::on_mouse_button);
    glfwSetKeyCallback(window_, &WindowInput::on_key);
    glfwSetWindowSizeCallback(window_, &WindowInput::on_window_size);
    glfwSetFramebufferSizeCallback(window_, &WindowInput::on_framebuffer_size);
}

void WindowInput::shutdown() {
    if (window_) {
        glfwDestroyWindow(window_);
        window_ = nullptr;
    }
    events_.clear();

    if (g_glfw_init_count > 0) {
        --g_glfw_init_count;
        if (g_glfw_init_count == 0) {
            glfwTerminate();
        }
    }
}

void WindowInput::poll_events() const {
    glfwPollEvents();
}

void WindowInput::wait_events() const {
    glfwWaitEvents();
}

bool WindowInput::should_close() const {
    if (!window_) return true;
    return glfwWindowShouldClose(window_);
}

void WindowInput::request_close() {
    if (window_) {
        glfwSetWindowShouldClose(window_, GLFW_TRUE);
    }
}

void WindowInput::drain_events(std::vector<PlatformEvent>& out) {
    out.clear();
    out.swap(events_);
}

void WindowInput::get_window_size(int& width, int& height) const {
    width = 0;
    height = 0;
    if (window_) {
        glfwGetWindowSize(window_, &width, &height);
    }
}

void WindowInput::get_framebuffer_size(int& width, int& height) const {
    width = 0;
    height = 0;
    if (window_) {
        glfwGetFramebufferSize(window_, &width, &height);
    }
}

WindowInput* WindowInput::from(GLFWwindow* window) {
    return static_cast<WindowInput*>(glfwGetWindowUserPointer(window));
}

void WindowInput::on_cursor_pos(GLFWwindow* window, double x, double y) {
    WindowInput* self = from(window);
    if (!self) return;
    self->cursor_x_ = x;
    self->cursor_y_ = y;
    PlatformEvent ev{};
    ev.type = PlatformEventType::PointerMoved;
    ev.x = x;
    ev.y = y;
    self->push(ev);
}

void WindowInput::on_mouse_button(GLFWwindow* window, int button, int action, int /*mods*/) {
    WindowInput* self = from(window);
    if (!self || button != GLFW_MOUSE_BUTTON_LEFT) return;
    PlatformEvent ev{};
    if (action == GLFW_PRESS) {
        ev.type = PlatformEventType::PointerPressed;
    } else if (action == GLFW_RELEASE) {
        ev.type = PlatformEventType::PointerReleased;
    } else {
        return;
    }
    glfwGetCursorPos(window, &self->cursor_x_, &self->cursor_y_);
    ev.x = self->cursor_x_;
    ev.y = self->cursor_y_;
    self->push(ev);
}

void WindowInput::on_key(GLFWwindow* window, int key, int /*scancode*/, int action, int mods) {
    WindowInput* self = from(window);
    if (!self || action != GLFW_PRESS) return;
    PlatformEvent ev{};
    if (key == GLFW_KEY_Z && (mods & GLFW_MOD_CONTROL)) {
        ev.type = PlatformEventType::UndoRequested;
    } else if (key == GLFW_KEY_ESCAPE) {
        ev.type = PlatformEventType::CloseRequested;
    } else {
        return;
    }
    self->push(ev);
}

void WindowInput::on_window_size(GLFWwindow* window, int width, int height) {
    WindowInput* self = from(window);
    if (!self) return;
    PlatformEvent ev{};
    ev.type = PlatformEventType::WindowResized;
    ev.width = width;
    ev.height = height;
    self->push(ev);
}

void WindowInput::on_framebuffer_size(GLFWwindow* window, int width, int height) {
    WindowInput* self = from(window);
    if (!self) return;
    PlatformEvent ev{};
    ev.type = PlatformEventType::FramebufferResized;
    ev.width = width;
    ev.height = height;
    self->push(ev);
}

} // namespace scribble
