#pragma once

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "vk_handle.h"

namespace scribble {

class Renderer;
struct AppConfig;

// Push constant block shared with shaders/line.vert.
struct LinePushConstants {
    float half_width_px = 1.5f;
    float pad = 0.0f;
    float viewport[2] = {0.0f, 0.0f};
};

// Everything whose lifetime follows the surface extent: the image chain, its
// views and framebuffers, the color-only render pass, the line pipeline and one
// command buffer per swapchain image.
class SurfaceSwapchain {
public:
    SurfaceSwapchain() = default;
    ~SurfaceSwapchain();

    SurfaceSwapchain(const SurfaceSwapchain&) = delete;
    SurfaceSwapchain& operator=(const SurfaceSwapchain&) = delete;

    // Returns false when the surface has zero area; call rebuild() once it has
    // been restored.
    bool create(Renderer& renderer, const AppConfig& config);

    // Tears down and rebuilds at the current surface extent. The caller makes
    // sure the device is idle. Returns false for a zero-area surface.
    bool rebuild();

    void destroy();

    bool ready() const { return static_cast<bool>(swapchain_); }

    VkSwapchainKHR swapchain() const { return swapchain_.get(); }
    VkFormat format() const { return format_; }
    VkExtent2D extent() const { return extent_; }
    VkPresentModeKHR present_mode() const { return present_mode_; }
    std::size_t image_count() const { return images_.size(); }

    VkRenderPass render_pass() const { return render_pass_.get(); }
    VkPipeline pipeline() const { return pipeline_.get(); }
    VkPipelineLayout pipeline_layout() const { return pipeline_layout_.get(); }
    VkFramebuffer framebuffer(uint32_t image_index) const { return framebuffers_.at(image_index).get(); }
    VkCommandBuffer command_buffer(uint32_t image_index) const { return command_buffers_.at(image_index); }

private:
    bool create_swapchain();
    void create_image_views();
    void create_render_pass();
    void create_pipeline();
    void create_framebuffers();
    void create_command_buffers();
    void cleanup();

    std::vector<std::string> shader_candidates(const std::string& configured) const;

    Renderer* renderer_ = nullptr;
    VkDevice device_ = VK_NULL_HANDLE;
    std::string vertex_shader_;
    std::string fragment_shader_;

    vk::UniqueSwapchain swapchain_;
    VkFormat format_ = VK_FORMAT_UNDEFINED;
    VkExtent2D extent_{0, 0};
    VkPresentModeKHR present_mode_ = VK_PRESENT_MODE_FIFO_KHR;
    std::vector<VkImage> images_;
    std::vector<vk::UniqueImageView> image_views_;
    vk::UniqueRenderPass render_pass_;
    vk::UniquePipelineLayout pipeline_layout_;
    vk::UniquePipeline pipeline_;
    std::vector<vk::UniqueFramebuffer> framebuffers_;
    vk::UniqueCommandPool command_pool_;
    std::vector<VkCommandBuffer> command_buffers_;
};

} // namespace scribble
