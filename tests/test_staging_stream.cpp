#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "staging_stream.h"

using scribble::LineSegment;
using scribble::StagingStream;

namespace {

std::vector<LineSegment> make_segments(std::size_t n, float base) {
    std::vector<LineSegment> out;
    for (std::size_t i = 0; i < n; ++i) {
        const float x = base + static_cast<float>(i);
        out.push_back(LineSegment::from_endpoints({x, 0.0f}, {x + 1.0f, 0.0f}));
    }
    return out;
}

}

TEST(StagingStream, RejectsUnusableLayouts) {
    std::vector<LineSegment> memory(3);
    EXPECT_THROW(StagingStream(memory, 0), std::invalid_argument);
    EXPECT_THROW(StagingStream(memory, 4), std::invalid_argument);
    EXPECT_FALSE(StagingStream().valid());
}

TEST(StagingStream, WriteIsClampedToOneRegion) {
    std::vector<LineSegment> memory(8);
    StagingStream staging(memory, 2);
    const auto segments = make_segments(6, 10.0f);

    EXPECT_EQ(staging.write(1, segments), 4u);
    EXPECT_FLOAT_EQ(memory[4].center.x, 10.5f);
    EXPECT_FLOAT_EQ(memory[7].center.x, 13.5f);
    // Region 0 untouched.
    EXPECT_FLOAT_EQ(memory[0].center.x, 0.0f);
}

TEST(StagingStream, RegionsDoNotOverlap) {
    std::vector<LineSegment> memory(8);
    StagingStream staging(memory, 2);
    staging.write(0, make_segments(4, 0.0f));
    staging.write(1, make_segments(4, 100.0f));
    EXPECT_FLOAT_EQ(staging.region(0)[3].center.x, 3.5f);
    EXPECT_FLOAT_EQ(staging.region(1)[0].center.x, 100.5f);
    EXPECT_THROW(staging.write(2, make_segments(1, 0.0f)), std::out_of_range);
}
