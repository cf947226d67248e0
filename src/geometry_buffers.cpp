#include "geometry_buffers.h"

#include <array>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "config_loader.h"
#include "renderer.h"
#include "vk_utils.h"

namespace scribble {

namespace vk {

MappedMemory::MappedMemory(VkDevice device, VkDeviceMemory memory, VkDeviceSize size)
    : device_(device), memory_(memory), size_(size) {
    throw_if_failed(vkMapMemory(device_, memory_, 0, size_, 0, &data_), "vkMapMemory failed");
}

MappedMemory::MappedMemory(MappedMemory&& other) noexcept
    : device_(std::exchange(other.device_, VK_NULL_HANDLE)),
      memory_(std::exchange(other.memory_, VK_NULL_HANDLE)),
      size_(std::exchange(other.size_, 0)),
      data_(std::exchange(other.data_, nullptr)) {}

MappedMemory& MappedMemory::operator=(MappedMemory&& other) noexcept {
    if (this != &other) {
        reset();
        device_ = std::exchange(other.device_, VK_NULL_HANDLE);
        memory_ = std::exchange(other.memory_, VK_NULL_HANDLE);
        size_ = std::exchange(other.size_, 0);
        data_ = std::exchange(other.data_, nullptr);
    }
    return *this;
}

void MappedMemory::reset() {
    if (data_ && device_ && memory_) {
        vkUnmapMemory(device_, memory_);
    }
    data_ = nullptr;
    memory_ = VK_NULL_HANDLE;
    device_ = VK_NULL_HANDLE;
    size_ = 0;
}

} // namespace vk

namespace {

// Unit quad expanded by the vertex shader: x runs along the segment, y across it.
const std::array<Vec2, 4> kQuadCorners = {{
    {-0.5f, -0.5f}, {0.5f, -0.5f}, {0.5f, 0.5f}, {-0.5f, 0.5f}
}};
const std::array<uint16_t, GeometryBuffers::kQuadIndexCount> kQuadIndices = {{0, 1, 2, 2, 3, 0}};

constexpr VkDeviceSize segment_bytes(std::size_t count) {
    return static_cast<VkDeviceSize>(count) * sizeof(LineSegment);
}

} // namespace

GeometryBuffers::~GeometryBuffers() {
    destroy();
}

void GeometryBuffers::create(Renderer& renderer, const AppConfig& config) {
    destroy();
    device_ = renderer.device();
    VkPhysicalDevice phys = renderer.physical_device();

    device_capacity_ = config.max_vertices;
    staging_segments_ = static_cast<std::size_t>(config.staging_buffer_vertex_count) *
                        static_cast<std::size_t>(config.max_frames_in_flight);

    vk::create_buffer(phys, device_, segment_bytes(device_capacity_),
                      VK_BUFFER_USAGE_TRANSFER_DST_BIT | VK_BUFFER_USAGE_VERTEX_BUFFER_BIT,
                      VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, segment_buffer_, segment_memory_);

    vk::create_buffer(phys, device_, segment_bytes(staging_segments_),
                      VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                      VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                      staging_buffer_, staging_memory_);
    staging_map_ = vk::MappedMemory(device_, staging_memory_.get(), segment_bytes(staging_segments_));

    upload_static_geometry(renderer);

    std::cout << "[vk] geometry buffers: " << device_capacity_ << " segments device-local, "
              << config.staging_buffer_vertex_count << " x " << config.max_frames_in_flight
              << " staging\n";
}

void GeometryBuffers::upload_static_geometry(Renderer& renderer) {
    VkPhysicalDevice phys = renderer.physical_device();
    const VkDeviceSize quad_size = sizeof(kQuadCorners);
    const VkDeviceSize index_size = sizeof(kQuadIndices);

    vk::create_buffer(phys, device_, quad_size,
                      VK_BUFFER_USAGE_TRANSFER_DST_BIT | VK_BUFFER_USAGE_VERTEX_BUFFER_BIT,
                      VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, quad_buffer_, quad_memory_);
    vk::create_buffer(phys, device_, index_size,
                      VK_BUFFER_USAGE_TRANSFER_DST_BIT | VK_BUFFER_USAGE_INDEX_BUFFER_BIT,
                      VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT, index_buffer_, index_memory_);

    vk::UniqueBuffer upload;
    vk::UniqueDeviceMemory upload_memory;
    vk::create_buffer(phys, device_, quad_size + index_size, VK_BUFFER_USAGE_TRANSFER_SRC_BIT,
                      VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT,
                      upload, upload_memory);
    vk::upload_host_visible(device_, upload_memory.get(), quad_size, kQuadCorners.data(), 0);
    vk::upload_host_visible(device_, upload_memory.get(), index_size, kQuadIndices.data(), quad_size);

    VkCommandBuffer cmd = vk::begin_one_time_commands(device_, renderer.upload_pool());
    VkBufferCopy quad_region{0, 0, quad_size};
    vkCmdCopyBuffer(cmd, upload.get(), quad_buffer_.get(), 1, &quad_region);
    VkBufferCopy index_region{quad_size, 0, index_size};
    vkCmdCopyBuffer(cmd, upload.get(), index_buffer_.get(), 1, &index_region);
    vk::end_one_time_commands(device_, renderer.graphics_queue(), renderer.upload_pool(), cmd);
}

void GeometryBuffers::destroy() {
    staging_map_.reset();
    staging_buffer_.reset();
    staging_memory_.reset();
    segment_buffer_.reset();
    segment_memory_.reset();
    index_buffer_.reset();
    index_memory_.reset();
    quad_buffer_.reset();
    quad_memory_.reset();
    device_ = VK_NULL_HANDLE;
    device_capacity_ = 0;
    staging_segments_ = 0;
    cmd_ = VK_NULL_HANDLE;
    copies_ = 0;
}

std::span<LineSegment> GeometryBuffers::staging_span() const {
    if (!staging_map_.data()) return {};
    return {static_cast<LineSegment*>(staging_map_.data()), staging_segments_};
}

void GeometryBuffers::begin(VkCommandBuffer cmd) {
    cmd_ = cmd;
    copies_ = 0;

    VkBufferMemoryBarrier barrier{};
    barrier.sType = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER;
    barrier.srcAccessMask = VK_ACCESS_VERTEX_ATTRIBUTE_READ_BIT;
    barrier.dstAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.buffer = segment_buffer_.get();
    barrier.offset = 0;
    barrier.size = VK_WHOLE_SIZE;
    vkCmdPipelineBarrier(cmd_, VK_PIPELINE_STAGE_VERTEX_INPUT_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT, 0,
                         0, nullptr, 1, &barrier, 0, nullptr);
}

void GeometryBuffers::copy_segments(std::size_t src_first, std::size_t dst_first, std::size_t count) {
    if (count == 0) return;
    if (cmd_ == VK_NULL_HANDLE) {
        throw std::logic_error("GeometryBuffers::copy_segments outside begin/finish");
    }
    if (src_first + count > staging_segments_ || dst_first + count > device_capacity_) {
        throw std::out_of_range("segment copy outside buffer bounds");
    }
    VkBufferCopy region{segment_bytes(src_first), segment_bytes(dst_first), segment_bytes(count)};
    vkCmdCopyBuffer(cmd_, staging_buffer_.get(), segment_buffer_.get(), 1, &region);
    ++copies_;
}

void GeometryBuffers::finish() {
    if (cmd_ != VK_NULL_HANDLE && copies_ > 0) {
        VkBufferMemoryBarrier barrier{};
        barrier.sType = VK_STRUCTURE_TYPE_BUFFER_MEMORY_BARRIER;
        barrier.srcAccessMask = VK_ACCESS_TRANSFER_WRITE_BIT;
        barrier.dstAccessMask = VK_ACCESS_VERTEX_ATTRIBUTE_READ_BIT;
        barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
        barrier.buffer = segment_buffer_.get();
        barrier.offset = 0;
        barrier.size = VK_WHOLE_SIZE;
        vkCmdPipelineBarrier(cmd_, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_VERTEX_INPUT_BIT, 0,
                             0, nullptr, 1, &barrier, 0, nullptr);
    }
    cmd_ = VK_NULL_HANDLE;
}

} // namespace scribble
