#pragma once

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <vector>

#include "frame_scheduler.h"
#include "vk_handle.h"

namespace scribble {

class Renderer;
class SurfaceSwapchain;

// FrameBackend over a real device: one in-flight fence and an acquire/render
// semaphore pair per frame slot, submitting the swapchain's per-image command
// buffers on the graphics queue.
class VulkanFrameBackend : public FrameBackend {
public:
    VulkanFrameBackend(Renderer& renderer, SurfaceSwapchain& swapchain, std::size_t slot_count, uint64_t fence_timeout_ms);
    ~VulkanFrameBackend() override;

    std::size_t slot_count() const override { return slots_.size(); }
    std::size_t image_count() const override;

    void wait_slot(std::size_t slot) override;
    void reset_slot(std::size_t slot) override;
    AcquiredImage acquire_image(std::size_t slot) override;
    void submit(std::size_t slot, uint32_t image_index) override;
    SurfaceStatus present(std::size_t slot, uint32_t image_index) override;
    void wait_idle() override;
    bool rebuild_surface() override;

private:
    struct FrameSlot {
        vk::UniqueSemaphore image_available;
        vk::UniqueSemaphore render_finished;
        vk::UniqueFence in_flight;
    };

    Renderer& renderer_;
    SurfaceSwapchain& swapchain_;
    std::vector<FrameSlot> slots_;
    uint64_t fence_timeout_ns_ = 0;
};

} // namespace scribble
