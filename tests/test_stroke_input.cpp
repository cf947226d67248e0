#include <gtest/gtest.h>

#include <vector>

#include "device_geometry_buffer.h"
#include "geometry_log.h"
#include "geometry_streamer.h"
#include "platform_input.h"
#include "staging_stream.h"
#include "stroke_input.h"

using namespace scribble;

namespace {

PlatformEvent pointer(PlatformEventType type, double x, double y) {
    PlatformEvent ev{};
    ev.type = type;
    ev.x = x;
    ev.y = y;
    return ev;
}

PlatformEvent resize(int w, int h) {
    PlatformEvent ev{};
    ev.type = PlatformEventType::WindowResized;
    ev.width = w;
    ev.height = h;
    return ev;
}

struct InputFixture {
    InputFixture()
        : staging_memory(64),
          staging(staging_memory, 1),
          device(1024),
          streamer(log, staging, device),
          input(streamer) {
        input.set_window_size(800, 600);
    }

    std::vector<LineSegment> staging_memory;
    GeometryLog log;
    StagingStream staging;
    DeviceGeometryBuffer device;
    GeometryStreamer streamer;
    StrokeInput input;
};

}

TEST(PixelToNdc, MapsCornersAndCenter) {
    Point2D p = pixel_to_ndc(0.0, 0.0, 800, 600);
    EXPECT_FLOAT_EQ(p.x, -1.0f);
    EXPECT_FLOAT_EQ(p.y, -1.0f);
    p = pixel_to_ndc(800.0, 600.0, 800, 600);
    EXPECT_FLOAT_EQ(p.x, 1.0f);
    EXPECT_FLOAT_EQ(p.y, 1.0f);
    p = pixel_to_ndc(400.0, 150.0, 800, 600);
    EXPECT_FLOAT_EQ(p.x, 0.0f);
    EXPECT_FLOAT_EQ(p.y, -0.5f);
}

TEST(StrokeInput, PressMoveReleaseCommitsOneStroke) {
    InputFixture f;
    EXPECT_TRUE(f.input.handle(pointer(PlatformEventType::PointerPressed, 100, 100)));
    EXPECT_TRUE(f.input.pointer_down());
    f.input.handle(pointer(PlatformEventType::PointerMoved, 200, 100));
    f.input.handle(pointer(PlatformEventType::PointerMoved, 300, 100));
    EXPECT_EQ(f.log.pending_size(), 2u);

    EXPECT_TRUE(f.input.handle(pointer(PlatformEventType::PointerReleased, 300, 100)));
    EXPECT_FALSE(f.input.pointer_down());
    EXPECT_EQ(f.log.pending_size(), 0u);
    EXPECT_EQ(f.log.committed_stroke_count(), 1u);
    EXPECT_EQ(f.log.total_committed_segments(), 2u);
}

TEST(StrokeInput, HoverDoesNotDraw) {
    InputFixture f;
    EXPECT_FALSE(f.input.handle(pointer(PlatformEventType::PointerMoved, 10, 10)));
    EXPECT_FALSE(f.input.handle(pointer(PlatformEventType::PointerMoved, 500, 500)));
    EXPECT_FALSE(f.log.anchor().has_value());
    EXPECT_FALSE(f.input.handle(pointer(PlatformEventType::PointerReleased, 500, 500)));
    EXPECT_EQ(f.log.committed_stroke_count(), 0u);
}

TEST(StrokeInput, UndoRemovesLastStroke) {
    InputFixture f;
    f.input.handle(pointer(PlatformEventType::PointerPressed, 0, 0));
    f.input.handle(pointer(PlatformEventType::PointerMoved, 400, 300));
    f.input.handle(pointer(PlatformEventType::PointerReleased, 400, 300));
    ASSERT_EQ(f.log.committed_stroke_count(), 1u);

    PlatformEvent undo{};
    undo.type = PlatformEventType::UndoRequested;
    EXPECT_TRUE(f.input.handle(undo));
    EXPECT_EQ(f.log.committed_stroke_count(), 0u);
    EXPECT_FALSE(f.input.handle(undo));
}

TEST(StrokeInput, ResizeChangesMapping) {
    InputFixture f;
    f.input.handle(resize(400, 400));
    EXPECT_EQ(f.input.window_width(), 400);
    f.input.handle(pointer(PlatformEventType::PointerPressed, 200, 200));
    ASSERT_TRUE(f.log.anchor().has_value());
    EXPECT_FLOAT_EQ(f.log.anchor()->x, 0.0f);
    EXPECT_FLOAT_EQ(f.log.anchor()->y, 0.0f);
}

TEST(StrokeInput, ZeroSizedWindowIgnoresPoints) {
    InputFixture f;
    f.input.handle(resize(0, 0));
    EXPECT_FALSE(f.input.handle(pointer(PlatformEventType::PointerPressed, 10, 10)));
    EXPECT_FALSE(f.log.anchor().has_value());
}
