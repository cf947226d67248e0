#include "stroke_input.h"

#include <iostream>

namespace scribble {

Point2D pixel_to_ndc(double x, double y, int width, int height) {
    return {static_cast<float>(x / static_cast<double>(width) * 2.0 - 1.0),
            static_cast<float>(y / static_cast<double>(height) * 2.0 - 1.0)};
}

void StrokeInput::set_window_size(int width, int height) {
    window_width_ = width;
    window_height_ = height;
}

bool StrokeInput::handle(const PlatformEvent& event) {
    switch (event.type) {
        case PlatformEventType::PointerPressed:
            pointer_down_ = true;
            return append(event.x, event.y);
        case PlatformEventType::PointerMoved:
            if (!pointer_down_) return false;
            return append(event.x, event.y);
        case PlatformEventType::PointerReleased:
            if (!pointer_down_) return false;
            pointer_down_ = false;
            streamer_.end_stroke();
            return true;
        case PlatformEventType::UndoRequested:
            if (streamer_.undo()) {
                std::cout << "[app] undo, " << streamer_.log().committed_stroke_count() << " strokes left\n";
                return true;
            }
            return false;
        case PlatformEventType::WindowResized:
            set_window_size(event.width, event.height);
            return false;
        case PlatformEventType::FramebufferResized:
        case PlatformEventType::CloseRequested:
            return false;
    }
    return false;
}

bool StrokeInput::append(double x, double y) {
    // A minimized window has no cursor space to map into.
    if (window_width_ <= 0 || window_height_ <= 0) {
        return false;
    }
    streamer_.log().append_vertex(pixel_to_ndc(x, y, window_width_, window_height_));
    return true;
}

} // namespace scribble
