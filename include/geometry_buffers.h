#pragma once

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <span>

#include "device_geometry_buffer.h"
#include "geometry.h"
#include "vk_handle.h"

namespace scribble {

class Renderer;
struct AppConfig;

namespace vk {

// Keeps a host-visible allocation mapped for as long as it lives.
class MappedMemory {
public:
    MappedMemory() = default;
    MappedMemory(VkDevice device, VkDeviceMemory memory, VkDeviceSize size);
    ~MappedMemory() { reset(); }

    MappedMemory(const MappedMemory&) = delete;
    MappedMemory& operator=(const MappedMemory&) = delete;
    MappedMemory(MappedMemory&& other) noexcept;
    MappedMemory& operator=(MappedMemory&& other) noexcept;

    void reset();

    void* data() const { return data_; }
    VkDeviceSize size() const { return size_; }

private:
    VkDevice device_ = VK_NULL_HANDLE;
    VkDeviceMemory memory_ = VK_NULL_HANDLE;
    VkDeviceSize size_ = 0;
    void* data_ = nullptr;
};

} // namespace vk

// GPU buffers for line drawing: the static quad and its indices, the
// device-local segment array and the persistently mapped staging buffer that
// feeds it. Copies are recorded into the command buffer passed to begin().
class GeometryBuffers : public GeometryCopySink {
public:
    static constexpr uint32_t kQuadIndexCount = 6;

    GeometryBuffers() = default;
    ~GeometryBuffers() override;

    GeometryBuffers(const GeometryBuffers&) = delete;
    GeometryBuffers& operator=(const GeometryBuffers&) = delete;

    void create(Renderer& renderer, const AppConfig& config);
    void destroy();

    // The whole staging mapping, staging_buffer_vertex_count segments per
    // frame slot.
    std::span<LineSegment> staging_span() const;
    std::size_t device_capacity() const { return device_capacity_; }

    // Orders this frame's copies after earlier draws that read the segment array.
    void begin(VkCommandBuffer cmd);
    void copy_segments(std::size_t src_first, std::size_t dst_first, std::size_t count) override;
    // Makes this frame's copies visible to vertex input. No-op if nothing was copied.
    void finish();

    std::size_t copies_recorded() const { return copies_; }

    VkBuffer quad_buffer() const { return quad_buffer_.get(); }
    VkBuffer index_buffer() const { return index_buffer_.get(); }
    VkBuffer segment_buffer() const { return segment_buffer_.get(); }

private:
    void upload_static_geometry(Renderer& renderer);

    VkDevice device_ = VK_NULL_HANDLE;
    std::size_t device_capacity_ = 0;
    std::size_t staging_segments_ = 0;

    vk::UniqueBuffer quad_buffer_;
    vk::UniqueDeviceMemory quad_memory_;
    vk::UniqueBuffer index_buffer_;
    vk::UniqueDeviceMemory index_memory_;
    vk::UniqueBuffer segment_buffer_;
    vk::UniqueDeviceMemory segment_memory_;
    vk::UniqueBuffer staging_buffer_;
    vk::UniqueDeviceMemory staging_memory_;
    vk::MappedMemory staging_map_;

    VkCommandBuffer cmd_ = VK_NULL_HANDLE;
    std::size_t copies_ = 0;
};

} // namespace scribble
