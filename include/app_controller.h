#pragma once

#include <string>
#include <utility>

#include "config_loader.h"
#include "platform_layer.h"

namespace scribble {

// Owns the window and the event loop. Frames are drawn only when input,
// streaming or a resize calls for one; otherwise the loop sleeps in the OS
// event queue.
class AppController {
public:
    explicit AppController(AppConfig config) : config_(std::move(config)) {}
    int run();

private:
    AppConfig config_;
    PlatformLayer platform_;
};

} // namespace scribble
