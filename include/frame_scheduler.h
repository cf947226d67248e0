#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace scribble {

enum class SurfaceStatus {
    Ok,
    Suboptimal,
    OutOfDate
};

struct AcquiredImage {
    SurfaceStatus status = SurfaceStatus::Ok;
    uint32_t image_index = 0;
};

// GPU side of the frame loop. The Vulkan implementation owns one fence and two
// semaphores per frame slot plus the swapchain it presents to; a test backend
// only counts calls.
class FrameBackend {
public:
    virtual ~FrameBackend() = default;

    virtual std::size_t slot_count() const = 0;
    virtual std::size_t image_count() const = 0;

    // Blocks until the slot's fence has signalled.
    virtual void wait_slot(std::size_t slot) = 0;
    virtual void reset_slot(std::size_t slot) = 0;
    virtual AcquiredImage acquire_image(std::size_t slot) = 0;
    virtual void submit(std::size_t slot, uint32_t image_index) = 0;
    virtual SurfaceStatus present(std::size_t slot, uint32_t image_index) = 0;
    virtual void wait_idle() = 0;

    // Rebuilds the swapchain and everything created from it. Returns false if
    // the surface currently has zero area and nothing was built.
    virtual bool rebuild_surface() = 0;
};

enum class SchedulerState {
    Running,
    SurfaceInvalid,
    Destroying
};

enum class SlotState {
    Idle,
    Acquiring,
    Recording,
    Submitted,
    Presenting
};

enum class FrameStatus {
    Presented,
    Skipped,
    Minimized,
    Stopped
};

const char* to_string(FrameStatus status);

class FrameScheduler {
public:
    struct FrameContext {
        std::size_t slot = 0;
        uint32_t image_index = 0;
        uint64_t frame_number = 0;
    };

    struct Callbacks {
        std::function<void(const FrameContext&)> record;
        std::function<void()> on_surface_rebuilt;
    };

    FrameScheduler() = default;
    explicit FrameScheduler(std::unique_ptr<FrameBackend> backend);
    ~FrameScheduler();

    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    void reset(std::unique_ptr<FrameBackend> backend);

    // Acquire, record, submit and present one frame.
    FrameStatus render(const Callbacks& callbacks);

    // Surface extent changed. Zero in either dimension suspends rendering.
    void notify_resize(uint32_t width, uint32_t height);

    // Stops accepting frames, waits for the device and releases the backend.
    void shutdown();

    SchedulerState state() const { return state_; }
    SlotState slot_state(std::size_t slot) const { return slot_states_.at(slot); }
    std::size_t current_slot() const { return current_slot_; }
    bool minimized() const { return minimized_; }
    bool resize_pending() const { return resize_pending_ || rebuild_before_frame_; }
    uint64_t frames_presented() const { return frames_presented_; }
    uint64_t rebuild_count() const { return rebuild_count_; }
    std::optional<std::size_t> image_owner(uint32_t image_index) const { return images_in_flight_.at(image_index); }
    FrameBackend* backend() const { return backend_.get(); }

private:
    bool rebuild(const Callbacks& callbacks);
    void advance_slot();

    std::unique_ptr<FrameBackend> backend_;
    SchedulerState state_ = SchedulerState::Running;
    std::vector<SlotState> slot_states_;
    std::vector<std::optional<std::size_t>> images_in_flight_;
    std::size_t current_slot_ = 0;
    uint64_t frame_number_ = 0;
    uint64_t frames_presented_ = 0;
    uint64_t rebuild_count_ = 0;
    bool minimized_ = false;
    bool resize_pending_ = false;
    bool rebuild_before_frame_ = false;
};

} // namespace scribble
