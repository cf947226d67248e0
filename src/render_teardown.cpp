#include "render_teardown.h"

#include <iostream>

namespace scribble {

void teardown_renderer(FrameScheduler& scheduler, RenderResources& resources) {
    scheduler.shutdown();
    resources.destroy_swapchain();
    resources.destroy_geometry();
    resources.destroy_device();
    std::cout << "[app] renderer torn down\n";
}

} // namespace scribble
