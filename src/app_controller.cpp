#include "app_controller.h"

#include <iostream>

#include "scribble_app.h"

namespace scribble {

int AppController::run() {
    PlatformLayer::Config platform_cfg;
    platform_cfg.initial_width = config_.window_width;
    platform_cfg.initial_height = config_.window_height;
    platform_cfg.title = config_.window_title;
    platform_.initialize(platform_cfg);

    {
        ScribbleApp app(config_);
        app.initialize(platform_);

        while (!platform_.should_close()) {
            // Sleep until the OS has something for us unless a frame is owed.
            platform_.pump_events(!app.needs_frame());
            for (const PlatformEvent& ev : platform_.events()) {
                app.handle_event(ev);
            }
            if (platform_.should_close()) {
                break;
            }

            if (app.minimized()) {
                // Some platforms restore without a framebuffer-size callback.
                int fbw = 0;
                int fbh = 0;
                platform_.get_framebuffer_size(fbw, fbh);
                if (fbw > 0 && fbh > 0) {
                    PlatformEvent ev{};
                    ev.type = PlatformEventType::FramebufferResized;
                    ev.width = fbw;
                    ev.height = fbh;
                    app.handle_event(ev);
                }
                if (app.minimized()) continue;
            }

            if (app.needs_frame()) {
                app.draw_frame();
            }
        }

        std::cout << "[app] closing with " << app.log().committed_stroke_count() << " strokes\n";
        app.shutdown();
    }

    platform_.shutdown();
    return 0;
}

} // namespace scribble
