#pragma once

#include <utility>
#include <vulkan/vulkan.h>

namespace scribble::vk {

// Device-child handle with a single owner. Destroyed with DestroyFn on reset,
// reassignment or scope exit.
template <typename Handle, auto DestroyFn>
class UniqueHandle {
public:
    UniqueHandle() = default;
    UniqueHandle(VkDevice device, Handle handle) : device_(device), handle_(handle) {}

    ~UniqueHandle() { reset(); }

    UniqueHandle(const UniqueHandle&) = delete;
    UniqueHandle& operator=(const UniqueHandle&) = delete;

    UniqueHandle(UniqueHandle&& other) noexcept
        : device_(std::exchange(other.device_, VK_NULL_HANDLE)),
          handle_(std::exchange(other.handle_, Handle{})) {}

    UniqueHandle& operator=(UniqueHandle&& other) noexcept {
        if (this != &other) {
            reset();
            device_ = std::exchange(other.device_, VK_NULL_HANDLE);
            handle_ = std::exchange(other.handle_, Handle{});
        }
        return *this;
    }

    void reset() {
        if (handle_ != Handle{} && device_ != VK_NULL_HANDLE) {
            DestroyFn(device_, handle_, nullptr);
        }
        handle_ = Handle{};
        device_ = VK_NULL_HANDLE;
    }

    // Destroys the current handle and returns the slot a vkCreate* call should
    // write the new one into, e.g. vkCreateFence(dev, &ci, nullptr, fence.replace(dev)).
    Handle* replace(VkDevice device) {
        reset();
        device_ = device;
        return &handle_;
    }

    [[nodiscard]] Handle get() const { return handle_; }
    [[nodiscard]] VkDevice device() const { return device_; }
    explicit operator bool() const { return handle_ != Handle{}; }

    Handle release() {
        device_ = VK_NULL_HANDLE;
        return std::exchange(handle_, Handle{});
    }

private:
    VkDevice device_ = VK_NULL_HANDLE;
    Handle handle_ = Handle{};
};

using UniqueBuffer = UniqueHandle<VkBuffer, vkDestroyBuffer>;
using UniqueDeviceMemory = UniqueHandle<VkDeviceMemory, vkFreeMemory>;
using UniqueCommandPool = UniqueHandle<VkCommandPool, vkDestroyCommandPool>;
using UniqueFence = UniqueHandle<VkFence, vkDestroyFence>;
using UniqueSemaphore = UniqueHandle<VkSemaphore, vkDestroySemaphore>;
using UniqueSwapchain = UniqueHandle<VkSwapchainKHR, vkDestroySwapchainKHR>;
using UniqueImageView = UniqueHandle<VkImageView, vkDestroyImageView>;
using UniqueRenderPass = UniqueHandle<VkRenderPass, vkDestroyRenderPass>;
using UniqueFramebuffer = UniqueHandle<VkFramebuffer, vkDestroyFramebuffer>;
using UniquePipeline = UniqueHandle<VkPipeline, vkDestroyPipeline>;
using UniquePipelineLayout = UniqueHandle<VkPipelineLayout, vkDestroyPipelineLayout>;
using UniqueShaderModule = UniqueHandle<VkShaderModule, vkDestroyShaderModule>;

} // namespace scribble::vk
