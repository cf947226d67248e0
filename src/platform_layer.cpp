#include "platform_layer.h"

namespace scribble {

PlatformLayer::~PlatformLayer() {
    shutdown();
}

void PlatformLayer::initialize(const Config& config) {
    if (initialized_) {
        return;
    }
    config_ = config;
    window_.initialize(config.initial_width, config.initial_height, config.title);
    initialized_ = true;
}

void PlatformLayer::shutdown() {
    if (!initialized_) {
        return;
    }
    window_.shutdown();
    events_.clear();
    initialized_ = false;
}

void PlatformLayer::pump_events(bool block) {
    if (block) {
        window_.wait_events();
    } else {
        window_.poll_events();
    }
    window_.drain_events(events_);
}

bool PlatformLayer::should_close() const {
    return window_.should_close();
}

void PlatformLayer::request_close() {
    window_.request_close();
}

void PlatformLayer::get_window_size(int& width, int& height) const {
    window_.get_window_size(width, height);
}

void PlatformLayer::get_framebuffer_size(int& width, int& height) const {
    window_.get_framebuffer_size(width, height);
}

GLFWwindow* PlatformLayer::window_handle() const {
    return window_.handle();
}

} // namespace scribble
