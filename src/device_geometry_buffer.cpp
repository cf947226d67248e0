#include "device_geometry_buffer.h"

#include <algorithm>
#include <string>

namespace scribble {

CapacityExceededError::CapacityExceededError(std::size_t requested, std::size_t capacity)
    : std::runtime_error("geometry capacity exceeded: " + std::to_string(requested) +
                         " segments requested, max_vertices=" + std::to_string(capacity)),
      requested_(requested),
      capacity_(capacity) {}

void DeviceGeometryBuffer::ensure_room(std::size_t count) const {
    if (count > capacity_ - committed_) {
        throw CapacityExceededError(committed_ + count, capacity_);
    }
}

void DeviceGeometryBuffer::append_from_staging(GeometryCopySink& sink, std::size_t src_first, std::size_t count) {
    if (count == 0) return;
    ensure_room(count);
    sink.copy_segments(src_first, committed_, count);
    committed_ += count;
}

std::size_t DeviceGeometryBuffer::write_tail(GeometryCopySink& sink, std::size_t src_first, std::size_t count) {
    count = std::min(count, remaining());
    if (count == 0) return 0;
    sink.copy_segments(src_first, committed_, count);
    return count;
}

void DeviceGeometryBuffer::truncate(std::size_t count) {
    committed_ = std::min(committed_, count);
}

} // namespace scribble
