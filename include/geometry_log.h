#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <vector>

#include "geometry.h"

namespace scribble {

using Stroke = std::vector<LineSegment>;

// CPU-side record of everything drawn: committed strokes plus the stroke the
// pointer is currently producing. Input appends and the render thread drains,
// so every entry point takes the same lock.
class GeometryLog {
public:
    GeometryLog() = default;

    GeometryLog(const GeometryLog&) = delete;
    GeometryLog& operator=(const GeometryLog&) = delete;

    // Extends the pending stroke towards p. The first point of a stroke only
    // anchors it; points within kVertexEpsilon of the current end are dropped.
    // While a split stroke is open, pending restarts from its committed end.
    void append_vertex(Point2D p);

    // Moves pending into a new committed stroke and forgets the anchor.
    // An empty pending stroke records nothing.
    void commit();

    // Removes the most recently committed stroke. Returns false when there is
    // nothing to remove. Pending geometry is left alone, even when the removed
    // stroke is the one still being drawn.
    bool undo();

    // Moves the first count pending segments into the committed log. Fragments
    // of one stroke accumulate in a single committed stroke until commit().
    // Always clears the anchor. Returns true when pending was drained.
    bool commit_front(std::size_t count);

    std::size_t total_committed_segments() const;
    std::size_t committed_stroke_count() const;
    std::size_t pending_size() const;
    bool has_pending() const;
    std::optional<Point2D> anchor() const;

    // Runs fn on the pending segments while holding the lock.
    void with_pending(const std::function<void(std::span<const LineSegment>)>& fn) const;

    // Copies committed segments, flattened in commit order, starting at index
    // first. Returns how many were written to out.
    std::size_t copy_committed(std::size_t first, std::span<LineSegment> out) const;

    Stroke pending_snapshot() const;
    std::vector<Stroke> committed_snapshot() const;

private:
    mutable std::mutex mutex_;
    std::vector<Stroke> committed_;
    Stroke pending_;
    std::optional<Point2D> anchor_;
    std::size_t committed_total_ = 0;
    bool stroke_open_ = false;
};

} // namespace scribble
