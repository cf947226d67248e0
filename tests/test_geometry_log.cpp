#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "geometry_log.h"

using scribble::GeometryLog;
using scribble::LineSegment;

namespace {

void draw_line(GeometryLog& log, int points, float y = 0.0f) {
    for (int i = 0; i < points; ++i) {
        log.append_vertex({0.1f * static_cast<float>(i), y});
    }
}

}

TEST(LineSegment, ReconstructsEndpoints) {
    const auto seg = LineSegment::from_endpoints({-0.25f, 0.5f}, {0.75f, -0.5f});
    EXPECT_FLOAT_EQ(seg.center.x, 0.25f);
    EXPECT_FLOAT_EQ(seg.center.y, 0.0f);
    EXPECT_FLOAT_EQ(seg.direction.x, 1.0f);
    EXPECT_FLOAT_EQ(seg.direction.y, -1.0f);
    EXPECT_FLOAT_EQ(seg.start().x, -0.25f);
    EXPECT_FLOAT_EQ(seg.start().y, 0.5f);
    EXPECT_FLOAT_EQ(seg.end().x, 0.75f);
    EXPECT_FLOAT_EQ(seg.end().y, -0.5f);
}

TEST(GeometryLog, FirstPointOnlyAnchors) {
    GeometryLog log;
    log.append_vertex({0.0f, 0.0f});
    EXPECT_EQ(log.pending_size(), 0u);
    ASSERT_TRUE(log.anchor().has_value());
    EXPECT_FLOAT_EQ(log.anchor()->x, 0.0f);
}

TEST(GeometryLog, NearbyPointsAreDebounced) {
    GeometryLog log;
    log.append_vertex({0.0f, 0.0f});
    log.append_vertex({0.0f, 0.0005f});
    EXPECT_EQ(log.pending_size(), 0u);

    log.append_vertex({0.0f, 0.5f});
    ASSERT_EQ(log.pending_size(), 1u);

    // Repeating the current end point changes nothing.
    log.append_vertex({0.0f, 0.5f});
    log.append_vertex({0.0005f, 0.5f});
    EXPECT_EQ(log.pending_size(), 1u);
}

TEST(GeometryLog, TinyMoveThenRealMoveMakesOneSegment) {
    GeometryLog log;
    log.append_vertex({0.0f, 0.0f});
    log.append_vertex({0.0f, 0.0005f});
    log.append_vertex({0.0f, 0.5f});

    const auto pending = log.pending_snapshot();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_NEAR(pending[0].start().x, 0.0f, 1e-6f);
    EXPECT_NEAR(pending[0].start().y, 0.0f, 1e-6f);
    EXPECT_NEAR(pending[0].end().x, 0.0f, 1e-6f);
    EXPECT_NEAR(pending[0].end().y, 0.5f, 1e-6f);
}

TEST(GeometryLog, SegmentsChainEndToStart) {
    GeometryLog log;
    draw_line(log, 5);
    const auto pending = log.pending_snapshot();
    ASSERT_EQ(pending.size(), 4u);
    for (std::size_t i = 1; i < pending.size(); ++i) {
        EXPECT_NEAR(pending[i].start().x, pending[i - 1].end().x, 1e-6f);
        EXPECT_NEAR(pending[i].start().y, pending[i - 1].end().y, 1e-6f);
    }
}

TEST(GeometryLog, CommitThenUndoRestoresTotal) {
    GeometryLog log;
    draw_line(log, 4);
    log.commit();
    const std::size_t before = log.total_committed_segments();
    EXPECT_EQ(before, 3u);

    draw_line(log, 6, 0.5f);
    log.commit();
    EXPECT_EQ(log.committed_stroke_count(), 2u);
    EXPECT_EQ(log.total_committed_segments(), before + 5u);

    EXPECT_TRUE(log.undo());
    EXPECT_EQ(log.total_committed_segments(), before);
    EXPECT_EQ(log.committed_stroke_count(), 1u);
}

TEST(GeometryLog, CommitForgetsAnchor) {
    GeometryLog log;
    draw_line(log, 3);
    log.commit();
    EXPECT_FALSE(log.anchor().has_value());
    EXPECT_FALSE(log.has_pending());

    // The next press starts a new stroke instead of joining the old one.
    log.append_vertex({0.9f, 0.9f});
    EXPECT_EQ(log.pending_size(), 0u);
}

TEST(GeometryLog, EmptyCommitRecordsNothing) {
    GeometryLog log;
    log.commit();
    log.append_vertex({0.2f, 0.2f});
    log.commit();
    EXPECT_EQ(log.committed_stroke_count(), 0u);
    EXPECT_EQ(log.total_committed_segments(), 0u);
}

TEST(GeometryLog, UndoWithoutStrokesIsNoOp) {
    GeometryLog log;
    EXPECT_FALSE(log.undo());
    EXPECT_EQ(log.total_committed_segments(), 0u);
    EXPECT_EQ(log.committed_stroke_count(), 0u);
}

TEST(GeometryLog, UndoLeavesPendingAlone) {
    GeometryLog log;
    draw_line(log, 3);
    log.commit();
    draw_line(log, 4, 0.3f);
    EXPECT_TRUE(log.undo());
    EXPECT_EQ(log.pending_size(), 3u);
    EXPECT_EQ(log.committed_stroke_count(), 0u);
}

TEST(GeometryLog, CommitFrontMergesFragmentsIntoOneStroke) {
    GeometryLog log;
    draw_line(log, 11);
    ASSERT_EQ(log.pending_size(), 10u);

    EXPECT_FALSE(log.commit_front(4));
    EXPECT_EQ(log.committed_stroke_count(), 1u);
    EXPECT_FALSE(log.commit_front(4));
    EXPECT_TRUE(log.commit_front(4));
    EXPECT_EQ(log.total_committed_segments(), 10u);
    EXPECT_EQ(log.pending_size(), 0u);
    EXPECT_EQ(log.committed_stroke_count(), 1u);
    EXPECT_FALSE(log.anchor().has_value());

    // Still the same stroke while the pointer stays down, joined at the last end.
    log.append_vertex({1.5f, 0.0f});
    const auto pending = log.pending_snapshot();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_NEAR(pending[0].start().x, 1.0f, 1e-5f);
    EXPECT_NEAR(pending[0].end().x, 1.5f, 1e-5f);
    log.commit();
    EXPECT_EQ(log.committed_stroke_count(), 1u);
    EXPECT_EQ(log.total_committed_segments(), 11u);

    EXPECT_TRUE(log.undo());
    EXPECT_EQ(log.total_committed_segments(), 0u);
}

TEST(GeometryLog, PartialCommitFrontClearsAnchor) {
    GeometryLog log;
    draw_line(log, 6);
    EXPECT_FALSE(log.commit_front(2));
    EXPECT_FALSE(log.anchor().has_value());
    EXPECT_EQ(log.pending_size(), 3u);

    log.append_vertex({0.6f, 0.0f});
    EXPECT_EQ(log.pending_size(), 4u);
}

TEST(GeometryLog, UndoOfOpenStrokeKeepsPendingTail) {
    GeometryLog log;
    draw_line(log, 11);
    ASSERT_FALSE(log.commit_front(4));

    EXPECT_TRUE(log.undo());
    EXPECT_EQ(log.total_committed_segments(), 0u);
    EXPECT_EQ(log.committed_stroke_count(), 0u);
    EXPECT_EQ(log.pending_size(), 6u);

    // The rest of the stroke lands on release as a stroke of its own.
    log.commit();
    EXPECT_EQ(log.committed_stroke_count(), 1u);
    EXPECT_EQ(log.total_committed_segments(), 6u);
}

TEST(GeometryLog, UndoAfterDrainStartsFreshStroke) {
    GeometryLog log;
    draw_line(log, 3);
    ASSERT_TRUE(log.commit_front(8));
    EXPECT_TRUE(log.undo());

    // Nothing left to continue from: the next point only anchors.
    log.append_vertex({0.9f, 0.9f});
    EXPECT_EQ(log.pending_size(), 0u);
    ASSERT_TRUE(log.anchor().has_value());
    EXPECT_FLOAT_EQ(log.anchor()->x, 0.9f);
}

TEST(GeometryLog, CopyCommittedFlattensAcrossStrokes) {
    GeometryLog log;
    draw_line(log, 3);
    log.commit();
    draw_line(log, 4, 0.5f);
    log.commit();

    std::vector<LineSegment> out(10);
    const std::size_t n = log.copy_committed(1, out);
    ASSERT_EQ(n, 4u);
    const auto strokes = log.committed_snapshot();
    EXPECT_FLOAT_EQ(out[0].center.x, strokes[0][1].center.x);
    EXPECT_FLOAT_EQ(out[1].center.y, strokes[1][0].center.y);
    EXPECT_FLOAT_EQ(out[3].center.x, strokes[1][2].center.x);
}

TEST(GeometryLog, ConcurrentAppendAndDrain) {
    GeometryLog log;
    std::thread writer([&] {
        for (int i = 0; i < 2000; ++i) {
            log.append_vertex({static_cast<float>(i) * 0.01f, 0.0f});
        }
    });
    std::size_t drained = 0;
    for (int i = 0; i < 200; ++i) {
        log.commit_front(16);
        drained = log.total_committed_segments();
    }
    writer.join();
    log.commit();
    EXPECT_GE(log.total_committed_segments(), drained);
    EXPECT_EQ(log.total_committed_segments(), 1999u);
}
