#include "staging_stream.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace scribble {

StagingStream::StagingStream(std::span<LineSegment> mapped, std::size_t region_count)
    : mapped_(mapped),
      region_count_(region_count) {
    if (region_count_ == 0) {
        throw std::invalid_argument("staging stream needs at least one region");
    }
    capacity_ = mapped_.size() / region_count_;
    if (capacity_ == 0) {
        throw std::invalid_argument("staging stream of " + std::to_string(mapped_.size()) +
                                    " segments cannot hold " + std::to_string(region_count_) + " regions");
    }
}

std::size_t StagingStream::region_offset(std::size_t region) const {
    if (region >= region_count_) {
        throw std::out_of_range("staging region " + std::to_string(region) + " out of range");
    }
    return region * capacity_;
}

std::size_t StagingStream::write(std::size_t region, std::span<const LineSegment> segments) {
    std::span<LineSegment> dst = this->region(region);
    const std::size_t count = std::min(segments.size(), dst.size());
    std::copy_n(segments.begin(), count, dst.begin());
    return count;
}

std::span<LineSegment> StagingStream::region(std::size_t region) {
    return mapped_.subspan(region_offset(region), capacity_);
}

std::span<const LineSegment> StagingStream::region(std::size_t region) const {
    return mapped_.subspan(region_offset(region), capacity_);
}

} // namespace scribble
