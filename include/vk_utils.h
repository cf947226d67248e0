// Small Vulkan helpers shared by the renderer, the swapchain and the geometry buffers
#pragma once

#include <vulkan/vulkan.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "vk_handle.h"

namespace scribble { namespace vk {

// Any failing Vulkan call outside the swapchain recovery path.
class VulkanError : public std::runtime_error {
public:
    VulkanError(VkResult result, const std::string& what);
    VkResult result() const { return result_; }

private:
    VkResult result_;
};

// VK_ERROR_DEVICE_LOST, or a fence that did not signal within the timeout.
class DeviceLostError : public VulkanError {
public:
    using VulkanError::VulkanError;
};

const char* result_string(VkResult result);

// Throws VulkanError (DeviceLostError for VK_ERROR_DEVICE_LOST) unless r is VK_SUCCESS.
void throw_if_failed(VkResult r, const char* msg);

// Load a SPIR-V shader module from disk.
// If the exact path is not found, tries the fallback paths in order.
// Returns VK_NULL_HANDLE if no candidate could be read.
VkShaderModule load_shader_module(VkDevice device,
                                  const std::string& path,
                                  const std::vector<std::string>& fallbacks = {});

// Find a memory type index on the given physical device with the required flags.
// Returns UINT32_MAX when there is none.
uint32_t find_memory_type(VkPhysicalDevice phys,
                          uint32_t typeBits,
                          VkMemoryPropertyFlags properties);

// Create a buffer and allocate/bind memory with the requested properties.
// Does not upload any data.
void create_buffer(VkPhysicalDevice phys,
                   VkDevice device,
                   VkDeviceSize size,
                   VkBufferUsageFlags usage,
                   VkMemoryPropertyFlags properties,
                   UniqueBuffer& outBuffer,
                   UniqueDeviceMemory& outMemory);

// Upload to a host-visible, host-coherent allocation.
void upload_host_visible(VkDevice device,
                         VkDeviceMemory memory,
                         VkDeviceSize size,
                         const void* data,
                         VkDeviceSize offset = 0);

// One-time command helpers (graphics queue): begin/end submit and wait.
VkCommandBuffer begin_one_time_commands(VkDevice device, VkCommandPool pool);
void end_one_time_commands(VkDevice device, VkQueue queue, VkCommandPool pool, VkCommandBuffer cmd);

} } // namespace scribble::vk
