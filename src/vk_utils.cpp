#include "vk_utils.h"

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

namespace scribble { namespace vk {

VulkanError::VulkanError(VkResult result, const std::string& what)
    : std::runtime_error(what + " (VkResult=" + result_string(result) + ")"),
      result_(result) {}

const char* result_string(VkResult result) {
    switch (result) {
        case VK_SUCCESS: return "VK_SUCCESS";
        case VK_NOT_READY: return "VK_NOT_READY";
        case VK_TIMEOUT: return "VK_TIMEOUT";
        case VK_SUBOPTIMAL_KHR: return "VK_SUBOPTIMAL_KHR";
        case VK_ERROR_OUT_OF_HOST_MEMORY: return "VK_ERROR_OUT_OF_HOST_MEMORY";
        case VK_ERROR_OUT_OF_DEVICE_MEMORY: return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
        case VK_ERROR_INITIALIZATION_FAILED: return "VK_ERROR_INITIALIZATION_FAILED";
        case VK_ERROR_DEVICE_LOST: return "VK_ERROR_DEVICE_LOST";
        case VK_ERROR_MEMORY_MAP_FAILED: return "VK_ERROR_MEMORY_MAP_FAILED";
        case VK_ERROR_LAYER_NOT_PRESENT: return "VK_ERROR_LAYER_NOT_PRESENT";
        case VK_ERROR_EXTENSION_NOT_PRESENT: return "VK_ERROR_EXTENSION_NOT_PRESENT";
        case VK_ERROR_INCOMPATIBLE_DRIVER: return "VK_ERROR_INCOMPATIBLE_DRIVER";
        case VK_ERROR_SURFACE_LOST_KHR: return "VK_ERROR_SURFACE_LOST_KHR";
        case VK_ERROR_OUT_OF_DATE_KHR: return "VK_ERROR_OUT_OF_DATE_KHR";
        default: return "VK_ERROR_UNKNOWN";
    }
}

void throw_if_failed(VkResult r, const char* msg) {
    if (r == VK_SUCCESS) return;
    if (r == VK_ERROR_DEVICE_LOST) {
        throw DeviceLostError(r, msg);
    }
    throw VulkanError(r, msg);
}

static bool read_file_all(const std::string& p, std::vector<char>& out) {
    FILE* f = fopen(p.c_str(), "rb");
    if (!f) return false;
    fseek(f, 0, SEEK_END); long len = ftell(f); fseek(f, 0, SEEK_SET);
    if (len <= 0) { fclose(f); return false; }
    out.resize((size_t)len);
    size_t rd = fread(out.data(), 1, out.size(), f);
    fclose(f);
    return rd == out.size();
}

VkShaderModule load_shader_module(VkDevice device,
                                  const std::string& path,
                                  const std::vector<std::string>& fallbacks) {
    std::vector<char> buf;
    if (!read_file_all(path, buf)) {
        bool ok = false;
        for (const auto& alt : fallbacks) {
            if (read_file_all(alt, buf)) { ok = true; break; }
        }
        if (!ok) return VK_NULL_HANDLE;
    }
    // SPIR-V is a stream of 32-bit words; copy so pCode is suitably aligned.
    std::vector<uint32_t> words((buf.size() + 3) / 4);
    std::memcpy(words.data(), buf.data(), buf.size());
    VkShaderModuleCreateInfo ci{VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO};
    ci.codeSize = buf.size();
    ci.pCode = words.data();
    VkShaderModule mod = VK_NULL_HANDLE;
    throw_if_failed(vkCreateShaderModule(device, &ci, nullptr, &mod), "vkCreateShaderModule failed");
    return mod;
}

uint32_t find_memory_type(VkPhysicalDevice phys,
                          uint32_t typeBits,
                          VkMemoryPropertyFlags properties) {
    VkPhysicalDeviceMemoryProperties memProps{};
    vkGetPhysicalDeviceMemoryProperties(phys, &memProps);
    for (uint32_t i = 0; i < memProps.memoryTypeCount; ++i) {
        if ((typeBits & (1u << i)) && (memProps.memoryTypes[i].propertyFlags & properties) == properties) return i;
    }
    return UINT32_MAX;
}

void create_buffer(VkPhysicalDevice phys,
                   VkDevice device,
                   VkDeviceSize size,
                   VkBufferUsageFlags usage,
                   VkMemoryPropertyFlags properties,
                   UniqueBuffer& outBuffer,
                   UniqueDeviceMemory& outMemory) {
    VkBufferCreateInfo bci{VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO};
    bci.size = size; bci.usage = usage; bci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    throw_if_failed(vkCreateBuffer(device, &bci, nullptr, outBuffer.replace(device)), "vkCreateBuffer failed");
    VkMemoryRequirements req{}; vkGetBufferMemoryRequirements(device, outBuffer.get(), &req);
    uint32_t mt = find_memory_type(phys, req.memoryTypeBits, properties);
    if (mt == UINT32_MAX) {
        outBuffer.reset();
        throw VulkanError(VK_ERROR_OUT_OF_DEVICE_MEMORY, "no memory type for buffer of " + std::to_string(size) + " bytes");
    }
    VkMemoryAllocateInfo mai{VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO};
    mai.allocationSize = req.size; mai.memoryTypeIndex = mt;
    throw_if_failed(vkAllocateMemory(device, &mai, nullptr, outMemory.replace(device)), "vkAllocateMemory failed");
    throw_if_failed(vkBindBufferMemory(device, outBuffer.get(), outMemory.get(), 0), "vkBindBufferMemory failed");
}

void upload_host_visible(VkDevice device,
                         VkDeviceMemory memory,
                         VkDeviceSize size,
                         const void* data,
                         VkDeviceSize offset) {
    if (!data || size == 0) return;
    void* p = nullptr;
    throw_if_failed(vkMapMemory(device, memory, offset, size, 0, &p), "vkMapMemory failed");
    std::memcpy(p, data, (size_t)size);
    vkUnmapMemory(device, memory);
}

VkCommandBuffer begin_one_time_commands(VkDevice device, VkCommandPool pool) {
    VkCommandBufferAllocateInfo ai{VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO};
    ai.commandPool = pool; ai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY; ai.commandBufferCount = 1;
    VkCommandBuffer cmd = VK_NULL_HANDLE;
    throw_if_failed(vkAllocateCommandBuffers(device, &ai, &cmd), "vkAllocateCommandBuffers failed");
    VkCommandBufferBeginInfo bi{VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO};
    bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    VkResult r = vkBeginCommandBuffer(cmd, &bi);
    if (r != VK_SUCCESS) {
        vkFreeCommandBuffers(device, pool, 1, &cmd);
        throw_if_failed(r, "vkBeginCommandBuffer failed");
    }
    return cmd;
}

void end_one_time_commands(VkDevice device, VkQueue queue, VkCommandPool pool, VkCommandBuffer cmd) {
    VkResult r = vkEndCommandBuffer(cmd);
    if (r == VK_SUCCESS) {
        VkSubmitInfo si{VK_STRUCTURE_TYPE_SUBMIT_INFO};
        si.commandBufferCount = 1; si.pCommandBuffers = &cmd;
        r = vkQueueSubmit(queue, 1, &si, VK_NULL_HANDLE);
    }
    if (r == VK_SUCCESS) {
        r = vkQueueWaitIdle(queue);
    }
    vkFreeCommandBuffers(device, pool, 1, &cmd);
    throw_if_failed(r, "one-time command submission failed");
}

} } // namespace scribble::vk
