#pragma once

#include "geometry.h"
#include "geometry_streamer.h"
#include "platform_input.h"

namespace scribble {

// ndc = pixel / dimension * 2 - 1
Point2D pixel_to_ndc(double x, double y, int width, int height);

// Turns pointer and key events into stroke edits.
class StrokeInput {
public:
    explicit StrokeInput(GeometryStreamer& streamer) : streamer_(streamer) {}

    void set_window_size(int width, int height);

    // Returns true when the event changed the drawing.
    bool handle(const PlatformEvent& event);

    bool pointer_down() const { return pointer_down_; }
    int window_width() const { return window_width_; }
    int window_height() const { return window_height_; }

private:
    bool append(double x, double y);

    GeometryStreamer& streamer_;
    int window_width_ = 0;
    int window_height_ = 0;
    bool pointer_down_ = false;
};

} // namespace scribble
