#include "vk_frame_backend.h"

#include <iostream>
#include <stdexcept>
#include <string>

#include "renderer.h"
#include "surface_swapchain.h"
#include "vk_utils.h"

namespace scribble {

using vk::throw_if_failed;

VulkanFrameBackend::VulkanFrameBackend(Renderer& renderer, SurfaceSwapchain& swapchain,
                                       std::size_t slot_count, uint64_t fence_timeout_ms)
    : renderer_(renderer), swapchain_(swapchain), fence_timeout_ns_(fence_timeout_ms * 1000000ull) {
    if (slot_count == 0) {
        throw std::invalid_argument("at least one frame slot is required");
    }
    VkDevice device = renderer_.device();

    VkSemaphoreCreateInfo sci{};
    sci.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    VkFenceCreateInfo fci{};
    fci.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    fci.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    slots_.resize(slot_count);
    for (auto& slot : slots_) {
        throw_if_failed(vkCreateSemaphore(device, &sci, nullptr, slot.image_available.replace(device)), "vkCreateSemaphore failed");
        throw_if_failed(vkCreateSemaphore(device, &sci, nullptr, slot.render_finished.replace(device)), "vkCreateSemaphore failed");
        throw_if_failed(vkCreateFence(device, &fci, nullptr, slot.in_flight.replace(device)), "vkCreateFence failed");
    }
}

VulkanFrameBackend::~VulkanFrameBackend() {
    wait_idle();
}

std::size_t VulkanFrameBackend::image_count() const {
    return swapchain_.image_count();
}

void VulkanFrameBackend::wait_slot(std::size_t slot) {
    VkFence fence = slots_.at(slot).in_flight.get();
    VkResult r = vkWaitForFences(renderer_.device(), 1, &fence, VK_TRUE, fence_timeout_ns_);
    if (r == VK_TIMEOUT) {
        throw vk::DeviceLostError(r, "frame slot " + std::to_string(slot) + " fence did not signal within " +
                                         std::to_string(fence_timeout_ns_ / 1000000ull) + " ms");
    }
    throw_if_failed(r, "vkWaitForFences failed");
}

void VulkanFrameBackend::reset_slot(std::size_t slot) {
    VkFence fence = slots_.at(slot).in_flight.get();
    throw_if_failed(vkResetFences(renderer_.device(), 1, &fence), "vkResetFences failed");
}

AcquiredImage VulkanFrameBackend::acquire_image(std::size_t slot) {
    AcquiredImage out{};
    if (!swapchain_.ready()) {
        out.status = SurfaceStatus::OutOfDate;
        return out;
    }
    VkResult r = vkAcquireNextImageKHR(renderer_.device(), swapchain_.swapchain(), UINT64_MAX,
                                       slots_.at(slot).image_available.get(), VK_NULL_HANDLE, &out.image_index);
    if (r == VK_ERROR_OUT_OF_DATE_KHR) {
        out.status = SurfaceStatus::OutOfDate;
    } else if (r == VK_SUBOPTIMAL_KHR) {
        out.status = SurfaceStatus::Suboptimal;
    } else {
        throw_if_failed(r, "vkAcquireNextImageKHR failed");
    }
    return out;
}

void VulkanFrameBackend::submit(std::size_t slot, uint32_t image_index) {
    FrameSlot& s = slots_.at(slot);
    VkSemaphore wait = s.image_available.get();
    VkSemaphore signal = s.render_finished.get();
    VkCommandBuffer cmd = swapchain_.command_buffer(image_index);
    VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;

    VkSubmitInfo si{};
    si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    si.waitSemaphoreCount = 1;
    si.pWaitSemaphores = &wait;
    si.pWaitDstStageMask = &wait_stage;
    si.commandBufferCount = 1;
    si.pCommandBuffers = &cmd;
    si.signalSemaphoreCount = 1;
    si.pSignalSemaphores = &signal;
    throw_if_failed(vkQueueSubmit(renderer_.graphics_queue(), 1, &si, s.in_flight.get()), "vkQueueSubmit failed");
}

SurfaceStatus VulkanFrameBackend::present(std::size_t slot, uint32_t image_index) {
    VkSemaphore wait = slots_.at(slot).render_finished.get();
    VkSwapchainKHR swapchain = swapchain_.swapchain();

    VkPresentInfoKHR present{};
    present.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    present.waitSemaphoreCount = 1;
    present.pWaitSemaphores = &wait;
    present.swapchainCount = 1;
    present.pSwapchains = &swapchain;
    present.pImageIndices = &image_index;
    VkResult r = vkQueuePresentKHR(renderer_.present_queue(), &present);
    if (r == VK_ERROR_OUT_OF_DATE_KHR) {
        return SurfaceStatus::OutOfDate;
    }
    if (r == VK_SUBOPTIMAL_KHR) {
        return SurfaceStatus::Suboptimal;
    }
    throw_if_failed(r, "vkQueuePresentKHR failed");
    return SurfaceStatus::Ok;
}

// Runs from destructors and shutdown paths, so a failure is reported instead
// of thrown.
void VulkanFrameBackend::wait_idle() {
    VkDevice device = renderer_.device();
    if (!device) return;
    VkResult r = vkDeviceWaitIdle(device);
    if (r != VK_SUCCESS) {
        std::cerr << "[frame] vkDeviceWaitIdle failed: " << vk::result_string(r) << "\n";
    }
}

bool VulkanFrameBackend::rebuild_surface() {
    return swapchain_.rebuild();
}

} // namespace scribble
