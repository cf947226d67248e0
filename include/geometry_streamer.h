#pragma once

#include <cstddef>

#include "device_geometry_buffer.h"
#include "geometry_log.h"
#include "staging_stream.h"

namespace scribble {

struct StreamedFrame {
    std::size_t committed_segments = 0;
    std::size_t tail_segments = 0;

    std::size_t instance_count() const { return committed_segments + tail_segments; }
};

// Moves geometry from the log into device memory through the staging regions.
// All copies go through a GeometryCopySink, so the caller decides which command
// buffer they land in; that buffer must be submitted before the region it used
// is written again.
class GeometryStreamer {
public:
    GeometryStreamer(GeometryLog& log, StagingStream& staging, DeviceGeometryBuffer& device);

    void set_logging(bool enabled) { log_stream_ = enabled; }

    // One frame's worth of streaming into the given staging region:
    //  - strokes committed since the last frame are copied to the device first,
    //  - a pending stroke larger than the staging capacity is split with commit_batch,
    //  - otherwise the pending stroke is streamed past the committed range so it
    //    can be drawn before it is committed.
    StreamedFrame stream_frame(std::size_t region, GeometryCopySink& sink);

    // Commits min(pending, capacity) segments: stage them, copy them to the
    // device at the committed offset, then move them into the log. Throws
    // CapacityExceededError before touching staging, device or log.
    std::size_t commit_batch(std::size_t region, GeometryCopySink& sink);

    // Pointer release. Throws CapacityExceededError, leaving pending in place,
    // when the finished stroke would not fit on the device.
    void end_stroke();

    // Removes the last stroke from both the log and the device range.
    bool undo();

    // True while work is left that a redraw alone would not finish: the device
    // range lags the log, or pending is too long for one staging region.
    bool needs_frame() const;

    GeometryLog& log() { return log_; }
    const GeometryLog& log() const { return log_; }
    const DeviceGeometryBuffer& device() const { return device_; }
    const StagingStream& staging() const { return staging_; }

private:
    std::size_t catch_up(std::size_t region, GeometryCopySink& sink, std::size_t target);
    std::size_t stream_tail(std::size_t region, GeometryCopySink& sink);

    GeometryLog& log_;
    StagingStream& staging_;
    DeviceGeometryBuffer& device_;
    bool log_stream_ = false;
};

} // namespace scribble
