#include <gtest/gtest.h>

#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "frame_scheduler.h"

using namespace scribble;

namespace {

struct BackendLog {
    std::vector<std::string> calls;
    int rebuilds = 0;
    int presents = 0;
    int submits = 0;
    int wait_idles = 0;
    std::vector<std::size_t> waited_slots;
};

// Scripted stand-in for the Vulkan backend.
class FakeBackend : public FrameBackend {
public:
    FakeBackend(BackendLog& log, std::size_t slots, std::size_t images)
        : log_(log), slots_(slots), images_(images) {}

    std::size_t slot_count() const override { return slots_; }
    std::size_t image_count() const override { return images_; }

    void wait_slot(std::size_t slot) override {
        log_.calls.push_back("wait " + std::to_string(slot));
        log_.waited_slots.push_back(slot);
    }
    void reset_slot(std::size_t slot) override {
        log_.calls.push_back("reset " + std::to_string(slot));
    }
    AcquiredImage acquire_image(std::size_t) override {
        AcquiredImage out{};
        if (!acquire_script.empty()) {
            out.status = acquire_script.front();
            acquire_script.pop_front();
        }
        if (!image_script.empty()) {
            out.image_index = image_script.front();
            image_script.pop_front();
        } else {
            out.image_index = next_image_;
            next_image_ = (next_image_ + 1) % static_cast<uint32_t>(images_);
        }
        log_.calls.push_back("acquire " + std::to_string(out.image_index));
        return out;
    }
    void submit(std::size_t slot, uint32_t image) override {
        ++log_.submits;
        log_.calls.push_back("submit " + std::to_string(slot) + " " + std::to_string(image));
    }
    SurfaceStatus present(std::size_t, uint32_t) override {
        ++log_.presents;
        log_.calls.push_back("present");
        if (!present_script.empty()) {
            SurfaceStatus s = present_script.front();
            present_script.pop_front();
            return s;
        }
        return SurfaceStatus::Ok;
    }
    void wait_idle() override {
        ++log_.wait_idles;
    }
    bool rebuild_surface() override {
        log_.calls.push_back("rebuild");
        if (!surface_has_area) return false;
        ++log_.rebuilds;
        next_image_ = 0;
        return true;
    }

    std::deque<SurfaceStatus> acquire_script;
    std::deque<uint32_t> image_script;
    std::deque<SurfaceStatus> present_script;
    bool surface_has_area = true;

private:
    BackendLog& log_;
    std::size_t slots_;
    std::size_t images_;
    uint32_t next_image_ = 0;
};

struct SchedulerFixture {
    explicit SchedulerFixture(std::size_t slots = 2, std::size_t images = 3) {
        auto fake = std::make_unique<FakeBackend>(log, slots, images);
        backend = fake.get();
        scheduler.reset(std::move(fake));
        callbacks.record = [this](const FrameScheduler::FrameContext& ctx) {
            recorded.push_back(ctx);
        };
        callbacks.on_surface_rebuilt = [this]() { ++rebuilt_callbacks; };
    }

    BackendLog log;
    FakeBackend* backend = nullptr;
    FrameScheduler scheduler;
    FrameScheduler::Callbacks callbacks;
    std::vector<FrameScheduler::FrameContext> recorded;
    int rebuilt_callbacks = 0;
};

}

TEST(FrameScheduler, RejectsMissingBackend) {
    FrameScheduler scheduler;
    EXPECT_THROW(scheduler.reset(nullptr), std::invalid_argument);
    EXPECT_EQ(scheduler.render({}), FrameStatus::Stopped);
}

TEST(FrameScheduler, FrameFollowsWaitAcquireRecordSubmitPresent) {
    SchedulerFixture f;
    EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Presented);

    const std::vector<std::string> expected = {"wait 0", "acquire 0", "reset 0", "submit 0 0", "present"};
    EXPECT_EQ(f.log.calls, expected);
    ASSERT_EQ(f.recorded.size(), 1u);
    EXPECT_EQ(f.recorded[0].slot, 0u);
    EXPECT_EQ(f.recorded[0].image_index, 0u);
    EXPECT_EQ(f.scheduler.slot_state(0), SlotState::Idle);
    EXPECT_EQ(f.scheduler.frames_presented(), 1u);
}

TEST(FrameScheduler, SlotsAdvanceModuloCount) {
    SchedulerFixture f(2, 3);
    for (int i = 0; i < 5; ++i) {
        ASSERT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Presented);
    }
    ASSERT_EQ(f.recorded.size(), 5u);
    EXPECT_EQ(f.recorded[0].slot, 0u);
    EXPECT_EQ(f.recorded[1].slot, 1u);
    EXPECT_EQ(f.recorded[2].slot, 0u);
    EXPECT_EQ(f.recorded[4].frame_number, 4u);
    EXPECT_EQ(f.scheduler.current_slot(), 1u);
}

TEST(FrameScheduler, WaitsOnSlotThatStillOwnsTheImage) {
    SchedulerFixture f(2, 3);
    f.backend->image_script = {1, 1};
    ASSERT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Presented);
    EXPECT_EQ(f.scheduler.image_owner(1), std::optional<std::size_t>(0));

    f.log.calls.clear();
    ASSERT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Presented);
    const std::vector<std::string> expected = {"wait 1", "acquire 1", "wait 0", "reset 1", "submit 1 1", "present"};
    EXPECT_EQ(f.log.calls, expected);
    EXPECT_EQ(f.scheduler.image_owner(1), std::optional<std::size_t>(1));
}

TEST(FrameScheduler, OutOfDateAcquireRebuildsAndSkips) {
    SchedulerFixture f;
    f.backend->acquire_script = {SurfaceStatus::OutOfDate};

    EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Skipped);
    EXPECT_TRUE(f.recorded.empty());
    EXPECT_EQ(f.log.submits, 0);
    EXPECT_EQ(f.log.rebuilds, 1);
    EXPECT_EQ(f.rebuilt_callbacks, 1);
    EXPECT_EQ(f.scheduler.state(), SchedulerState::Running);
    // The slot is retried rather than skipped.
    EXPECT_EQ(f.scheduler.current_slot(), 0u);

    EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Presented);
    EXPECT_EQ(f.recorded.size(), 1u);
}

TEST(FrameScheduler, SuboptimalAcquireStillPresentsThenRebuilds) {
    SchedulerFixture f;
    f.backend->acquire_script = {SurfaceStatus::Suboptimal};

    EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Presented);
    EXPECT_EQ(f.log.presents, 1);
    EXPECT_EQ(f.log.rebuilds, 1);
    EXPECT_FALSE(f.scheduler.resize_pending());
}

TEST(FrameScheduler, StalePresentIsRecovered) {
    SchedulerFixture f;
    f.backend->present_script = {SurfaceStatus::OutOfDate};

    EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Skipped);
    EXPECT_EQ(f.log.rebuilds, 1);
    EXPECT_EQ(f.scheduler.state(), SchedulerState::Running);
    EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Presented);
}

TEST(FrameScheduler, ResizeRebuildsAfterNextPresent) {
    SchedulerFixture f;
    f.scheduler.notify_resize(640, 480);
    EXPECT_TRUE(f.scheduler.resize_pending());

    EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Presented);
    EXPECT_EQ(f.log.rebuilds, 1);
    EXPECT_EQ(f.log.calls.back(), "rebuild");
    EXPECT_FALSE(f.scheduler.resize_pending());
}

TEST(FrameScheduler, MinimizeThenRestoreRebuildsOnceAndPresents) {
    SchedulerFixture f;
    f.scheduler.notify_resize(0, 0);
    EXPECT_TRUE(f.scheduler.minimized());

    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Minimized);
    }
    EXPECT_EQ(f.log.presents, 0);
    EXPECT_TRUE(f.recorded.empty());

    f.scheduler.notify_resize(800, 600);
    EXPECT_FALSE(f.scheduler.minimized());

    EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Presented);
    EXPECT_EQ(f.log.rebuilds, 1);
    EXPECT_EQ(f.log.presents, 1);
    EXPECT_EQ(f.scheduler.rebuild_count(), 1u);

    EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Presented);
    EXPECT_EQ(f.log.rebuilds, 1);
}

TEST(FrameScheduler, ZeroAreaRebuildSuspendsRendering) {
    SchedulerFixture f;
    f.backend->acquire_script = {SurfaceStatus::OutOfDate};
    f.backend->surface_has_area = false;

    EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Skipped);
    EXPECT_TRUE(f.scheduler.minimized());
    EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Minimized);

    f.backend->surface_has_area = true;
    f.scheduler.notify_resize(1024, 768);
    EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Presented);
    EXPECT_EQ(f.log.rebuilds, 1);
}

TEST(FrameScheduler, ShutdownWaitsIdleAndStops) {
    SchedulerFixture f;
    ASSERT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Presented);
    f.scheduler.shutdown();
    EXPECT_EQ(f.log.wait_idles, 1);
    EXPECT_EQ(f.scheduler.state(), SchedulerState::Destroying);
    EXPECT_EQ(f.scheduler.backend(), nullptr);
    EXPECT_EQ(f.scheduler.render(f.callbacks), FrameStatus::Stopped);

    // Idempotent.
    f.scheduler.shutdown();
    EXPECT_EQ(f.log.wait_idles, 1);
}

TEST(FrameScheduler, RecordFailurePropagates) {
    SchedulerFixture f;
    f.callbacks.record = [](const FrameScheduler::FrameContext&) {
        throw std::runtime_error("record failed");
    };
    EXPECT_THROW(f.scheduler.render(f.callbacks), std::runtime_error);
    EXPECT_EQ(f.log.submits, 0);
}

TEST(FrameStatus, HasReadableNames) {
    EXPECT_STREQ(to_string(FrameStatus::Presented), "presented");
    EXPECT_STREQ(to_string(FrameStatus::Minimized), "minimized");
}
