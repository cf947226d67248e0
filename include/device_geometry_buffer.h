#pragma once

#include <cstddef>
#include <stdexcept>

namespace scribble {

// Raised when committing would push the device buffer past max_vertices.
class CapacityExceededError : public std::runtime_error {
public:
    CapacityExceededError(std::size_t requested, std::size_t capacity);

    std::size_t requested() const { return requested_; }
    std::size_t capacity() const { return capacity_; }

private:
    std::size_t requested_;
    std::size_t capacity_;
};

// Records staging -> device copies. Offsets and counts are in segments; the
// source offset is relative to the start of the staging mapping.
class GeometryCopySink {
public:
    virtual ~GeometryCopySink() = default;
    virtual void copy_segments(std::size_t src_first, std::size_t dst_first, std::size_t count) = 0;
};

// Range bookkeeping for the device-local segment array. Segments [0, committed)
// mirror the committed log; anything written past that is a provisional tail
// that the next commit overwrites.
class DeviceGeometryBuffer {
public:
    DeviceGeometryBuffer() = default;
    explicit DeviceGeometryBuffer(std::size_t capacity) : capacity_(capacity) {}

    std::size_t capacity() const { return capacity_; }
    std::size_t committed() const { return committed_; }
    std::size_t remaining() const { return capacity_ - committed_; }

    // Throws CapacityExceededError if count more segments do not fit.
    void ensure_room(std::size_t count) const;

    // Copies count staged segments to [committed, committed + count) and makes
    // them part of the committed range. Nothing is recorded if the check fails.
    void append_from_staging(GeometryCopySink& sink, std::size_t src_first, std::size_t count);

    // Copies staged segments past the committed range without committing them.
    // Clamped to the free space; returns the number actually copied.
    std::size_t write_tail(GeometryCopySink& sink, std::size_t src_first, std::size_t count);

    // Drops committed segments past count (undo).
    void truncate(std::size_t count);

private:
    std::size_t capacity_ = 0;
    std::size_t committed_ = 0;
};

} // namespace scribble
