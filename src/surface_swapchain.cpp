#include "surface_swapchain.h"

#include <GLFW/glfw3.h>

#include <algorithm>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "config_loader.h"
#include "geometry.h"
#include "renderer.h"
#include "vk_utils.h"

#ifndef SCRIBBLE_SHADER_DIR
#define SCRIBBLE_SHADER_DIR "shaders"
#endif

namespace scribble {

using vk::throw_if_failed;

namespace {

const char* present_mode_name(VkPresentModeKHR mode) {
    switch (mode) {
        case VK_PRESENT_MODE_MAILBOX_KHR: return "MAILBOX";
        case VK_PRESENT_MODE_IMMEDIATE_KHR: return "IMMEDIATE";
        case VK_PRESENT_MODE_FIFO_RELAXED_KHR: return "FIFO_RELAXED";
        default: return "FIFO";
    }
}

std::string file_name(const std::string& path) {
    const auto slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

SurfaceSwapchain::~SurfaceSwapchain() {
    destroy();
}

bool SurfaceSwapchain::create(Renderer& renderer, const AppConfig& config) {
    destroy();
    renderer_ = &renderer;
    device_ = renderer.device();
    vertex_shader_ = config.vertex_shader;
    fragment_shader_ = config.fragment_shader;

    VkCommandPoolCreateInfo pci{};
    pci.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    pci.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    pci.queueFamilyIndex = renderer.graphics_queue_family();
    throw_if_failed(vkCreateCommandPool(device_, &pci, nullptr, command_pool_.replace(device_)),
                    "vkCreateCommandPool failed");

    return rebuild();
}

bool SurfaceSwapchain::rebuild() {
    if (!renderer_) {
        throw std::logic_error("SurfaceSwapchain::rebuild before create");
    }
    cleanup();
    if (!create_swapchain()) {
        return false;
    }
    create_image_views();
    create_render_pass();
    create_pipeline();
    create_framebuffers();
    create_command_buffers();
    return true;
}

void SurfaceSwapchain::destroy() {
    cleanup();
    swapchain_.reset();
    command_pool_.reset();
    renderer_ = nullptr;
    device_ = VK_NULL_HANDLE;
}

// Reverse creation order. The swapchain itself survives so the next one can be
// created with it as oldSwapchain.
void SurfaceSwapchain::cleanup() {
    if (!command_buffers_.empty() && command_pool_) {
        vkFreeCommandBuffers(device_, command_pool_.get(), static_cast<uint32_t>(command_buffers_.size()),
                             command_buffers_.data());
    }
    command_buffers_.clear();
    framebuffers_.clear();
    pipeline_.reset();
    pipeline_layout_.reset();
    render_pass_.reset();
    image_views_.clear();
    images_.clear();
}

bool SurfaceSwapchain::create_swapchain() {
    VkPhysicalDevice phys = renderer_->physical_device();
    VkSurfaceKHR surface = renderer_->surface();

    VkSurfaceCapabilitiesKHR caps{};
    throw_if_failed(vkGetPhysicalDeviceSurfaceCapabilitiesKHR(phys, surface, &caps),
                    "vkGetPhysicalDeviceSurfaceCapabilitiesKHR failed");

    VkExtent2D extent = caps.currentExtent;
    if (extent.width == 0xFFFFFFFF) {
        int width = 0;
        int height = 0;
        glfwGetFramebufferSize(renderer_->window(), &width, &height);
        extent.width = std::clamp(static_cast<uint32_t>(std::max(width, 0)),
                                  caps.minImageExtent.width, caps.maxImageExtent.width);
        extent.height = std::clamp(static_cast<uint32_t>(std::max(height, 0)),
                                   caps.minImageExtent.height, caps.maxImageExtent.height);
    }
    if (extent.width == 0 || extent.height == 0) {
        swapchain_.reset();
        extent_ = {0, 0};
        return false;
    }

    uint32_t fmt_count = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(phys, surface, &fmt_count, nullptr);
    std::vector<VkSurfaceFormatKHR> formats(fmt_count);
    vkGetPhysicalDeviceSurfaceFormatsKHR(phys, surface, &fmt_count, formats.data());
    if (formats.empty()) {
        throw std::runtime_error("surface reports no formats");
    }

    uint32_t pm_count = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(phys, surface, &pm_count, nullptr);
    std::vector<VkPresentModeKHR> present_modes(pm_count);
    vkGetPhysicalDeviceSurfacePresentModesKHR(phys, surface, &pm_count, present_modes.data());

    VkSurfaceFormatKHR chosen_fmt = formats[0];
    for (auto f : formats) {
        if (f.format == VK_FORMAT_B8G8R8A8_SRGB && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) {
            chosen_fmt = f;
            break;
        }
    }

    VkPresentModeKHR chosen_pm = VK_PRESENT_MODE_FIFO_KHR;
    if (std::find(present_modes.begin(), present_modes.end(), VK_PRESENT_MODE_MAILBOX_KHR) != present_modes.end()) {
        chosen_pm = VK_PRESENT_MODE_MAILBOX_KHR;
    }

    uint32_t image_count = caps.minImageCount + 1;
    if (caps.maxImageCount && image_count > caps.maxImageCount) {
        image_count = caps.maxImageCount;
    }

    VkSwapchainCreateInfoKHR sci{};
    sci.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    sci.surface = surface;
    sci.minImageCount = image_count;
    sci.imageFormat = chosen_fmt.format;
    sci.imageColorSpace = chosen_fmt.colorSpace;
    sci.imageExtent = extent;
    sci.imageArrayLayers = 1;
    sci.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;

    const uint32_t gfx = renderer_->graphics_queue_family();
    const uint32_t present = renderer_->present_queue_family();
    uint32_t queue_indices[] = { gfx, present };
    if (gfx != present) {
        sci.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
        sci.queueFamilyIndexCount = 2;
        sci.pQueueFamilyIndices = queue_indices;
    } else {
        sci.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    }
    sci.preTransform = caps.currentTransform;
    sci.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    sci.presentMode = chosen_pm;
    sci.clipped = VK_TRUE;
    sci.oldSwapchain = swapchain_.get();

    VkSwapchainKHR created = VK_NULL_HANDLE;
    throw_if_failed(vkCreateSwapchainKHR(device_, &sci, nullptr, &created), "vkCreateSwapchainKHR failed");
    swapchain_ = vk::UniqueSwapchain(device_, created);

    uint32_t retrieved = 0;
    throw_if_failed(vkGetSwapchainImagesKHR(device_, swapchain_.get(), &retrieved, nullptr),
                    "vkGetSwapchainImagesKHR failed");
    images_.resize(retrieved);
    throw_if_failed(vkGetSwapchainImagesKHR(device_, swapchain_.get(), &retrieved, images_.data()),
                    "vkGetSwapchainImagesKHR failed");

    const bool mode_changed = chosen_pm != present_mode_ || format_ == VK_FORMAT_UNDEFINED;
    format_ = chosen_fmt.format;
    extent_ = extent;
    present_mode_ = chosen_pm;
    if (mode_changed) {
        std::cout << "[swapchain] present mode " << present_mode_name(chosen_pm) << "\n";
    }
    return true;
}

void SurfaceSwapchain::create_image_views() {
    image_views_.resize(images_.size());
    for (size_t i = 0; i < images_.size(); ++i) {
        VkImageViewCreateInfo ci{};
        ci.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        ci.image = images_[i];
        ci.viewType = VK_IMAGE_VIEW_TYPE_2D;
        ci.format = format_;
        ci.components = { VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY,
                          VK_COMPONENT_SWIZZLE_IDENTITY, VK_COMPONENT_SWIZZLE_IDENTITY };
        ci.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        ci.subresourceRange.levelCount = 1;
        ci.subresourceRange.layerCount = 1;
        throw_if_failed(vkCreateImageView(device_, &ci, nullptr, image_views_[i].replace(device_)),
                        "vkCreateImageView failed");
    }
}

void SurfaceSwapchain::create_render_pass() {
    VkAttachmentDescription color{};
    color.format = format_;
    color.samples = VK_SAMPLE_COUNT_1_BIT;
    color.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
    color.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
    color.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
    color.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
    color.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    color.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

    VkAttachmentReference color_ref{ 0, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL };

    VkSubpassDescription sub{};
    sub.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    sub.colorAttachmentCount = 1;
    sub.pColorAttachments = &color_ref;

    VkSubpassDependency dep{};
    dep.srcSubpass = VK_SUBPASS_EXTERNAL;
    dep.dstSubpass = 0;
    dep.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dep.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
    dep.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

    VkRenderPassCreateInfo rpci{};
    rpci.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
    rpci.attachmentCount = 1;
    rpci.pAttachments = &color;
    rpci.subpassCount = 1;
    rpci.pSubpasses = &sub;
    rpci.dependencyCount = 1;
    rpci.pDependencies = &dep;
    throw_if_failed(vkCreateRenderPass(device_, &rpci, nullptr, render_pass_.replace(device_)),
                    "vkCreateRenderPass failed");
}

std::vector<std::string> SurfaceSwapchain::shader_candidates(const std::string& configured) const {
    const std::string name = file_name(configured);
    std::vector<std::string> out;
    if (const char* dir = std::getenv("SCRIBBLE_SHADER_DIR")) {
        out.push_back(std::string(dir) + "/" + name);
    }
    out.push_back(std::string(SCRIBBLE_SHADER_DIR) + "/" + name);
    out.push_back("build/shaders/" + name);
    out.push_back("shaders/" + name);
    return out;
}

void SurfaceSwapchain::create_pipeline() {
    // Bytecode is re-read on every rebuild so edited shaders are picked up.
    vk::UniqueShaderModule vs(device_, vk::load_shader_module(device_, vertex_shader_, shader_candidates(vertex_shader_)));
    vk::UniqueShaderModule fs(device_, vk::load_shader_module(device_, fragment_shader_, shader_candidates(fragment_shader_)));
    if (!vs || !fs) {
        throw std::runtime_error("shader bytecode not found (" + vertex_shader_ + ", " + fragment_shader_ + ")");
    }

    VkPipelineShaderStageCreateInfo stages[2]{};
    stages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
    stages[0].module = vs.get();
    stages[0].pName = "main";
    stages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
    stages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
    stages[1].module = fs.get();
    stages[1].pName = "main";

    // Binding 0: quad corner per vertex. Binding 1: one LineSegment per instance.
    VkVertexInputBindingDescription bindings[2]{};
    bindings[0].binding = 0;
    bindings[0].stride = sizeof(Vec2);
    bindings[0].inputRate = VK_VERTEX_INPUT_RATE_VERTEX;
    bindings[1].binding = 1;
    bindings[1].stride = sizeof(LineSegment);
    bindings[1].inputRate = VK_VERTEX_INPUT_RATE_INSTANCE;

    VkVertexInputAttributeDescription attrs[3]{};
    attrs[0].location = 0;
    attrs[0].binding = 0;
    attrs[0].format = VK_FORMAT_R32G32_SFLOAT;
    attrs[0].offset = 0;
    attrs[1].location = 1;
    attrs[1].binding = 1;
    attrs[1].format = VK_FORMAT_R32G32_SFLOAT;
    attrs[1].offset = static_cast<uint32_t>(offsetof(LineSegment, center));
    attrs[2].location = 2;
    attrs[2].binding = 1;
    attrs[2].format = VK_FORMAT_R32G32_SFLOAT;
    attrs[2].offset = static_cast<uint32_t>(offsetof(LineSegment, direction));

    VkPipelineVertexInputStateCreateInfo vi{};
    vi.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
    vi.vertexBindingDescriptionCount = 2;
    vi.pVertexBindingDescriptions = bindings;
    vi.vertexAttributeDescriptionCount = 3;
    vi.pVertexAttributeDescriptions = attrs;

    VkPipelineInputAssemblyStateCreateInfo ia{};
    ia.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
    ia.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

    VkViewport vp{};
    vp.width = static_cast<float>(extent_.width);
    vp.height = static_cast<float>(extent_.height);
    vp.minDepth = 0.0f;
    vp.maxDepth = 1.0f;
    VkRect2D sc{};
    sc.offset = {0, 0};
    sc.extent = extent_;
    VkPipelineViewportStateCreateInfo vpstate{};
    vpstate.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
    vpstate.viewportCount = 1;
    vpstate.pViewports = &vp;
    vpstate.scissorCount = 1;
    vpstate.pScissors = &sc;

    VkPipelineRasterizationStateCreateInfo rs{};
    rs.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
    rs.polygonMode = VK_POLYGON_MODE_FILL;
    rs.cullMode = VK_CULL_MODE_NONE;
    rs.frontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
    rs.lineWidth = 1.0f;

    VkPipelineMultisampleStateCreateInfo ms{};
    ms.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
    ms.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

    VkPipelineColorBlendAttachmentState cba{};
    cba.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
    cba.blendEnable = VK_FALSE;
    VkPipelineColorBlendStateCreateInfo cb{};
    cb.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
    cb.attachmentCount = 1;
    cb.pAttachments = &cba;

    VkPushConstantRange pcr{};
    pcr.stageFlags = VK_SHADER_STAGE_VERTEX_BIT;
    pcr.offset = 0;
    pcr.size = sizeof(LinePushConstants);

    VkPipelineLayoutCreateInfo plci{};
    plci.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    plci.pushConstantRangeCount = 1;
    plci.pPushConstantRanges = &pcr;
    throw_if_failed(vkCreatePipelineLayout(device_, &plci, nullptr, pipeline_layout_.replace(device_)),
                    "vkCreatePipelineLayout failed");

    VkGraphicsPipelineCreateInfo gpi{};
    gpi.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
    gpi.stageCount = 2;
    gpi.pStages = stages;
    gpi.pVertexInputState = &vi;
    gpi.pInputAssemblyState = &ia;
    gpi.pViewportState = &vpstate;
    gpi.pRasterizationState = &rs;
    gpi.pMultisampleState = &ms;
    gpi.pDepthStencilState = nullptr;
    gpi.pColorBlendState = &cb;
    gpi.layout = pipeline_layout_.get();
    gpi.renderPass = render_pass_.get();
    gpi.subpass = 0;
    throw_if_failed(vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &gpi, nullptr, pipeline_.replace(device_)),
                    "vkCreateGraphicsPipelines failed");
}

void SurfaceSwapchain::create_framebuffers() {
    framebuffers_.resize(image_views_.size());
    for (size_t i = 0; i < framebuffers_.size(); ++i) {
        VkImageView attachment = image_views_[i].get();
        VkFramebufferCreateInfo fci{};
        fci.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
        fci.renderPass = render_pass_.get();
        fci.attachmentCount = 1;
        fci.pAttachments = &attachment;
        fci.width = extent_.width;
        fci.height = extent_.height;
        fci.layers = 1;
        throw_if_failed(vkCreateFramebuffer(device_, &fci, nullptr, framebuffers_[i].replace(device_)),
                        "vkCreateFramebuffer failed");
    }
}

void SurfaceSwapchain::create_command_buffers() {
    command_buffers_.resize(framebuffers_.size());
    if (command_buffers_.empty()) return;
    VkCommandBufferAllocateInfo ai{};
    ai.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    ai.commandPool = command_pool_.get();
    ai.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    ai.commandBufferCount = static_cast<uint32_t>(command_buffers_.size());
    VkResult r = vkAllocateCommandBuffers(device_, &ai, command_buffers_.data());
    if (r != VK_SUCCESS) {
        command_buffers_.clear();
        throw_if_failed(r, "vkAllocateCommandBuffers failed");
    }
}

} // namespace scribble
