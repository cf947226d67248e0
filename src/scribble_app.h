#pragma once

#include <vulkan/vulkan.h>

#include <memory>

#include "config_loader.h"
#include "device_geometry_buffer.h"
#include "frame_scheduler.h"
#include "geometry_buffers.h"
#include "geometry_log.h"
#include "geometry_streamer.h"
#include "platform_input.h"
#include "render_teardown.h"
#include "renderer.h"
#include "staging_stream.h"
#include "stroke_input.h"
#include "surface_swapchain.h"

namespace scribble {

class PlatformLayer;

class ScribbleApp final : private RenderResources {
public:
    explicit ScribbleApp(const AppConfig& config);
    ~ScribbleApp();

    ScribbleApp(const ScribbleApp&) = delete;
    ScribbleApp& operator=(const ScribbleApp&) = delete;

    void initialize(PlatformLayer& platform);
    void shutdown();

    void handle_event(const PlatformEvent& event);
    FrameStatus draw_frame();

    bool needs_frame() const;
    bool minimized() const { return scheduler_.minimized(); }

    const GeometryLog& log() const { return log_; }

private:
    void destroy_swapchain() override;
    void destroy_geometry() override;
    void destroy_device() override;

    void record_command_buffer(const FrameScheduler::FrameContext& ctx);

    AppConfig config_;
    PlatformLayer* platform_ = nullptr;

    Renderer renderer_;
    SurfaceSwapchain swapchain_;
    GeometryBuffers buffers_;

    GeometryLog log_;
    StagingStream staging_;
    DeviceGeometryBuffer device_geometry_;
    std::unique_ptr<GeometryStreamer> streamer_;
    std::unique_ptr<StrokeInput> input_;

    FrameScheduler scheduler_;
    bool redraw_ = true;
    bool initialized_ = false;
};

} // namespace scribble
