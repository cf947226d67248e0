#include "geometry_log.h"

#include <algorithm>

namespace scribble {

void GeometryLog::append_vertex(Point2D p) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_.empty()) {
        const Vec2 end = pending_.back().end();
        if (distance(end, p) > kVertexEpsilon) {
            pending_.push_back(LineSegment::from_endpoints(end, p));
        }
        return;
    }
    if (!anchor_) {
        // A split stroke still held down continues from its last committed end.
        if (stroke_open_ && !committed_.empty() && !committed_.back().empty()) {
            const Vec2 end = committed_.back().back().end();
            if (distance(end, p) > kVertexEpsilon) {
                pending_.push_back(LineSegment::from_endpoints(end, p));
            }
            return;
        }
        anchor_ = p;
        return;
    }
    if (distance(*anchor_, p) > kVertexEpsilon) {
        pending_.push_back(LineSegment::from_endpoints(*anchor_, p));
    }
}

void GeometryLog::commit() {
    std::lock_guard<std::mutex> lock(mutex_);
    anchor_.reset();
    if (pending_.empty()) {
        stroke_open_ = false;
        return;
    }
    if (stroke_open_ && !committed_.empty()) {
        Stroke& open = committed_.back();
        open.insert(open.end(), pending_.begin(), pending_.end());
    } else {
        committed_.push_back(pending_);
    }
    committed_total_ += pending_.size();
    pending_.clear();
    stroke_open_ = false;
}

bool GeometryLog::undo() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (committed_.empty()) {
        return false;
    }
    committed_total_ -= committed_.back().size();
    committed_.pop_back();
    // Undoing a stroke that is still being drawn drops its committed fragments
    // only. Pending is kept and commits later as a stroke of its own.
    stroke_open_ = false;
    return true;
}

bool GeometryLog::commit_front(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    count = std::min(count, pending_.size());
    if (count == 0) {
        return false;
    }
    auto split = pending_.begin() + static_cast<std::ptrdiff_t>(count);
    if (stroke_open_ && !committed_.empty()) {
        Stroke& open = committed_.back();
        open.insert(open.end(), pending_.begin(), split);
    } else {
        committed_.emplace_back(pending_.begin(), split);
    }
    pending_.erase(pending_.begin(), split);
    committed_total_ += count;

    // The pointer is still down: later points continue from the committed end.
    stroke_open_ = true;
    anchor_.reset();
    return pending_.empty();
}

std::size_t GeometryLog::total_committed_segments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return committed_total_;
}

std::size_t GeometryLog::committed_stroke_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return committed_.size();
}

std::size_t GeometryLog::pending_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool GeometryLog::has_pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !pending_.empty();
}

std::optional<Point2D> GeometryLog::anchor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return anchor_;
}

void GeometryLog::with_pending(const std::function<void(std::span<const LineSegment>)>& fn) const {
    std::lock_guard<std::mutex> lock(mutex_);
    fn(std::span<const LineSegment>(pending_.data(), pending_.size()));
}

std::size_t GeometryLog::copy_committed(std::size_t first, std::span<LineSegment> out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t written = 0;
    std::size_t base = 0;
    for (const Stroke& stroke : committed_) {
        if (written == out.size()) break;
        const std::size_t stroke_end = base + stroke.size();
        if (stroke_end > first) {
            std::size_t begin = (first > base) ? first - base : 0;
            std::size_t take = std::min(stroke.size() - begin, out.size() - written);
            std::copy_n(stroke.begin() + static_cast<std::ptrdiff_t>(begin), take, out.begin() + static_cast<std::ptrdiff_t>(written));
            written += take;
        }
        base = stroke_end;
    }
    return written;
}

Stroke GeometryLog::pending_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
}

std::vector<Stroke> GeometryLog::committed_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return committed_;
}

} // namespace scribble
