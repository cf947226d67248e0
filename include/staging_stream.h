#pragma once

#include <cstddef>
#include <span>

#include "geometry.h"

namespace scribble {

// Host-visible staging memory seen as LineSegment slots. The memory itself is
// owned (and kept mapped) elsewhere; this view splits it into one region per
// frame slot so a region is only rewritten after that slot's fence signalled.
class StagingStream {
public:
    StagingStream() = default;
    StagingStream(std::span<LineSegment> mapped, std::size_t region_count);

    std::size_t capacity() const { return capacity_; }
    std::size_t region_count() const { return region_count_; }
    bool valid() const { return capacity_ > 0; }

    // First slot of a region, in segments from the start of the mapping.
    std::size_t region_offset(std::size_t region) const;

    // Writes up to capacity() segments to the start of the region and returns
    // how many were written.
    std::size_t write(std::size_t region, std::span<const LineSegment> segments);

    std::span<LineSegment> region(std::size_t region);
    std::span<const LineSegment> region(std::size_t region) const;

private:
    std::span<LineSegment> mapped_{};
    std::size_t region_count_ = 0;
    std::size_t capacity_ = 0;
};

} // namespace scribble
