#pragma once

#include "frame_scheduler.h"

namespace scribble {

// GPU objects created after the device. teardown_renderer() releases them in
// reverse creation order once the scheduler has idled the device.
class RenderResources {
public:
    virtual ~RenderResources() = default;

    // Swapchain, views, render pass, pipeline, framebuffers, command buffers.
    virtual void destroy_swapchain() = 0;
    // Geometry buffers and the staging mapping, plus anything still viewing it.
    virtual void destroy_geometry() = 0;
    virtual void destroy_device() = 0;
};

// Stop frames -> device idle -> swapchain -> geometry -> device.
void teardown_renderer(FrameScheduler& scheduler, RenderResources& resources);

} // namespace scribble
