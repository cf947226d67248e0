#include "scribble_app.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include "platform_layer.h"
#include "vk_frame_backend.h"
#include "vk_utils.h"

namespace scribble {

using vk::throw_if_failed;

namespace {
constexpr float kLineHalfWidthPx = 1.5f;
}

ScribbleApp::ScribbleApp(const AppConfig& config) : config_(config) {}

ScribbleApp::~ScribbleApp() {
    shutdown();
}

void ScribbleApp::initialize(PlatformLayer& platform) {
    if (initialized_) {
        return;
    }
    platform_ = &platform;

    Renderer::CreateInfo rci{};
    rci.window = platform.window_handle();
    rci.enable_validation = config_.validation_enabled;
    rci.app_name = config_.window_title;
    renderer_.initialize(rci);

    // A window created minimized builds its swapchain on the first restore.
    swapchain_.create(renderer_, config_);
    buffers_.create(renderer_, config_);

    staging_ = StagingStream(buffers_.staging_span(), static_cast<std::size_t>(config_.max_frames_in_flight));
    device_geometry_ = DeviceGeometryBuffer(buffers_.device_capacity());
    streamer_ = std::make_unique<GeometryStreamer>(log_, staging_, device_geometry_);
    streamer_->set_logging(config_.log_stream);
    input_ = std::make_unique<StrokeInput>(*streamer_);

    int ww = 0;
    int wh = 0;
    platform.get_window_size(ww, wh);
    input_->set_window_size(ww, wh);

    scheduler_.reset(std::make_unique<VulkanFrameBackend>(renderer_, swapchain_,
                                                          static_cast<std::size_t>(config_.max_frames_in_flight),
                                                          config_.fence_timeout_ms));
    int fbw = 0;
    int fbh = 0;
    platform.get_framebuffer_size(fbw, fbh);
    if (fbw <= 0 || fbh <= 0) {
        scheduler_.notify_resize(0, 0);
    }

    initialized_ = true;
    redraw_ = true;
    std::cout << "[app] ready: " << swapchain_.extent().width << "x" << swapchain_.extent().height
              << ", " << config_.max_frames_in_flight << " frames in flight, capacity "
              << device_geometry_.capacity() << " segments\n";
}

void ScribbleApp::shutdown() {
    if (!initialized_ && !renderer_.device()) {
        return;
    }
    teardown_renderer(scheduler_, *this);
    platform_ = nullptr;
    initialized_ = false;
}

void ScribbleApp::destroy_swapchain() {
    swapchain_.destroy();
}

void ScribbleApp::destroy_geometry() {
    // The streamer and staging view point into the mapping about to go away.
    input_.reset();
    streamer_.reset();
    staging_ = StagingStream();
    buffers_.destroy();
}

void ScribbleApp::destroy_device() {
    renderer_.shutdown();
}

void ScribbleApp::handle_event(const PlatformEvent& event) {
    if (!initialized_) return;
    switch (event.type) {
        case PlatformEventType::FramebufferResized:
            scheduler_.notify_resize(static_cast<uint32_t>(std::max(event.width, 0)),
                                     static_cast<uint32_t>(std::max(event.height, 0)));
            redraw_ = true;
            break;
        case PlatformEventType::CloseRequested:
            if (platform_) platform_->request_close();
            break;
        default:
            if (input_->handle(event)) {
                redraw_ = true;
            }
            break;
    }
}

bool ScribbleApp::needs_frame() const {
    if (!initialized_ || scheduler_.minimized()) return false;
    return redraw_ || scheduler_.resize_pending() || streamer_->needs_frame();
}

FrameStatus ScribbleApp::draw_frame() {
    if (!initialized_) {
        return FrameStatus::Stopped;
    }
    FrameStatus status = scheduler_.render({
        .record = [&](const FrameScheduler::FrameContext& ctx) {
            record_command_buffer(ctx);
        },
        .on_surface_rebuilt = [&]() {
            redraw_ = true;
        }
    });
    if (status == FrameStatus::Presented) {
        redraw_ = false;
    }
    return status;
}

void ScribbleApp::record_command_buffer(const FrameScheduler::FrameContext& ctx) {
    VkCommandBuffer cmd = swapchain_.command_buffer(ctx.image_index);
    const VkExtent2D extent = swapchain_.extent();

    throw_if_failed(vkResetCommandBuffer(cmd, 0), "vkResetCommandBuffer failed");
    VkCommandBufferBeginInfo bi{};
    bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    throw_if_failed(vkBeginCommandBuffer(cmd, &bi), "vkBeginCommandBuffer failed");

    // Transfers must sit outside the render pass.
    buffers_.begin(cmd);
    const StreamedFrame streamed = streamer_->stream_frame(ctx.slot, buffers_);
    buffers_.finish();

    VkClearValue clear{ { {0.0f, 0.0f, 0.0f, 1.0f} } };
    VkRenderPassBeginInfo rbi{};
    rbi.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
    rbi.renderPass = swapchain_.render_pass();
    rbi.framebuffer = swapchain_.framebuffer(ctx.image_index);
    rbi.renderArea.offset = {0, 0};
    rbi.renderArea.extent = extent;
    rbi.clearValueCount = 1;
    rbi.pClearValues = &clear;
    vkCmdBeginRenderPass(cmd, &rbi, VK_SUBPASS_CONTENTS_INLINE);

    const uint32_t instances = static_cast<uint32_t>(streamed.instance_count());
    if (instances > 0) {
        vkCmdBindPipeline(cmd, VK_PIPELINE_BIND_POINT_GRAPHICS, swapchain_.pipeline());
        VkBuffer vertex_buffers[] = { buffers_.quad_buffer(), buffers_.segment_buffer() };
        VkDeviceSize offsets[] = { 0, 0 };
        vkCmdBindVertexBuffers(cmd, 0, 2, vertex_buffers, offsets);
        vkCmdBindIndexBuffer(cmd, buffers_.index_buffer(), 0, VK_INDEX_TYPE_UINT16);

        LinePushConstants pc{};
        pc.half_width_px = kLineHalfWidthPx;
        pc.viewport[0] = static_cast<float>(extent.width);
        pc.viewport[1] = static_cast<float>(extent.height);
        vkCmdPushConstants(cmd, swapchain_.pipeline_layout(), VK_SHADER_STAGE_VERTEX_BIT, 0, sizeof(pc), &pc);

        vkCmdDrawIndexed(cmd, GeometryBuffers::kQuadIndexCount, instances, 0, 0, 0);
    }

    vkCmdEndRenderPass(cmd);
    throw_if_failed(vkEndCommandBuffer(cmd), "vkEndCommandBuffer failed");
}

} // namespace scribble
