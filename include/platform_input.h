#pragma once

namespace scribble {

enum class PlatformEventType {
    PointerPressed,
    PointerReleased,
    PointerMoved,
    WindowResized,      // window size in screen coordinates (cursor space)
    FramebufferResized, // surface size in pixels
    UndoRequested,      // Ctrl+Z
    CloseRequested      // Escape
};

struct PlatformEvent {
    PlatformEventType type = PlatformEventType::PointerMoved;
    double x = 0.0;
    double y = 0.0;
    int width = 0;
    int height = 0;
};

} // namespace scribble
