#include "geometry_streamer.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace scribble {

GeometryStreamer::GeometryStreamer(GeometryLog& log, StagingStream& staging, DeviceGeometryBuffer& device)
    : log_(log), staging_(staging), device_(device) {}

StreamedFrame GeometryStreamer::stream_frame(std::size_t region, GeometryCopySink& sink) {
    StreamedFrame frame{};
    const std::size_t total = log_.total_committed_segments();
    if (device_.committed() < total) {
        catch_up(region, sink, total);
    } else if (log_.pending_size() > staging_.capacity()) {
        commit_batch(region, sink);
    } else {
        frame.tail_segments = stream_tail(region, sink);
    }
    frame.committed_segments = device_.committed();
    return frame;
}

std::size_t GeometryStreamer::commit_batch(std::size_t region, GeometryCopySink& sink) {
    if (device_.committed() != log_.total_committed_segments()) {
        throw std::logic_error("commit_batch with device range out of step with the log");
    }

    std::size_t n = 0;
    log_.with_pending([&](std::span<const LineSegment> pending) {
        n = std::min(pending.size(), staging_.capacity());
        if (n == 0) return;
        device_.ensure_room(n);
        staging_.write(region, pending.first(n));
    });
    if (n == 0) {
        return 0;
    }

    device_.append_from_staging(sink, staging_.region_offset(region), n);
    const bool drained = log_.commit_front(n);
    if (log_stream_) {
        std::cout << "[stream] commit n=" << n
                  << " committed=" << device_.committed()
                  << " pending=" << log_.pending_size()
                  << (drained ? " (caught up)" : " (split)") << "\n";
    }
    return n;
}

void GeometryStreamer::end_stroke() {
    // Committed segments not uploaded yet still need their room.
    const std::size_t lag = log_.total_committed_segments() - device_.committed();
    device_.ensure_room(lag + log_.pending_size());
    log_.commit();
}

bool GeometryStreamer::undo() {
    if (!log_.undo()) {
        return false;
    }
    device_.truncate(log_.total_committed_segments());
    if (log_stream_) {
        std::cout << "[stream] undo committed=" << device_.committed() << "\n";
    }
    return true;
}

bool GeometryStreamer::needs_frame() const {
    return device_.committed() != log_.total_committed_segments() || log_.pending_size() > staging_.capacity();
}

std::size_t GeometryStreamer::catch_up(std::size_t region, GeometryCopySink& sink, std::size_t target) {
    const std::size_t first = device_.committed();
    const std::size_t n = std::min(target - first, staging_.capacity());
    device_.ensure_room(n);
    const std::size_t staged = log_.copy_committed(first, staging_.region(region).first(n));
    device_.append_from_staging(sink, staging_.region_offset(region), staged);
    if (log_stream_) {
        std::cout << "[stream] upload n=" << staged << " committed=" << device_.committed()
                  << " target=" << target << "\n";
    }
    return staged;
}

std::size_t GeometryStreamer::stream_tail(std::size_t region, GeometryCopySink& sink) {
    std::size_t staged = 0;
    log_.with_pending([&](std::span<const LineSegment> pending) {
        staged = staging_.write(region, pending);
    });
    if (staged == 0) {
        return 0;
    }
    return device_.write_tail(sink, staging_.region_offset(region), staged);
}

} // namespace scribble
