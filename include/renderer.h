#pragma once

#include <vulkan/vulkan.h>

#include <cstdint>
#include <string>
#include <vector>

struct GLFWwindow;

namespace scribble {

// Instance, surface, device and queues. Everything sized by the surface lives
// in SurfaceSwapchain; frame synchronization lives in VulkanFrameBackend.
class Renderer {
public:
    struct CreateInfo {
        GLFWwindow* window = nullptr;
        bool enable_validation = false;
        std::string app_name = "scribble";
    };

    Renderer() = default;
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    void initialize(const CreateInfo& info);
    void shutdown();

    void wait_idle() const;

    GLFWwindow* window() const { return window_; }
    VkDevice device() const { return device_; }
    VkPhysicalDevice physical_device() const { return physical_device_; }
    VkInstance instance() const { return instance_; }
    VkSurfaceKHR surface() const { return surface_; }
    VkQueue graphics_queue() const { return queue_graphics_; }
    VkQueue present_queue() const { return queue_present_; }
    uint32_t graphics_queue_family() const { return queue_family_graphics_; }
    uint32_t present_queue_family() const { return queue_family_present_; }

    // Pool for one-shot transfer work on the graphics queue.
    VkCommandPool upload_pool() const { return upload_pool_; }

    bool validation_enabled() const { return enable_validation_; }

private:
    void create_instance();
    void setup_debug_messenger();
    void create_surface();
    void pick_physical_device();
    void create_logical_device();
    void create_upload_pool();
    void destroy_instance_objects();

    static bool has_layer(const char* name);
    static bool has_instance_extension(const char* name);
    static bool has_device_extension(VkPhysicalDevice dev, const char* name);

private:
    GLFWwindow* window_ = nullptr;
    bool enable_validation_ = false;
    std::string app_name_;

    VkInstance instance_ = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT debug_messenger_ = VK_NULL_HANDLE;
    VkSurfaceKHR surface_ = VK_NULL_HANDLE;
    VkPhysicalDevice physical_device_ = VK_NULL_HANDLE;
    VkDevice device_ = VK_NULL_HANDLE;
    uint32_t queue_family_graphics_ = 0;
    uint32_t queue_family_present_ = 0;
    VkQueue queue_graphics_ = VK_NULL_HANDLE;
    VkQueue queue_present_ = VK_NULL_HANDLE;
    VkCommandPool upload_pool_ = VK_NULL_HANDLE;

    std::vector<const char*> enabled_layers_;
    std::vector<const char*> enabled_instance_exts_;
    std::vector<const char*> enabled_device_exts_;
};

} // namespace scribble
