#include "frame_scheduler.h"

#include <iostream>
#include <stdexcept>

namespace scribble {

const char* to_string(FrameStatus status) {
    switch (status) {
        case FrameStatus::Presented: return "presented";
        case FrameStatus::Skipped: return "skipped";
        case FrameStatus::Minimized: return "minimized";
        case FrameStatus::Stopped: return "stopped";
    }
    return "unknown";
}

FrameScheduler::FrameScheduler(std::unique_ptr<FrameBackend> backend) {
    reset(std::move(backend));
}

FrameScheduler::~FrameScheduler() {
    shutdown();
}

void FrameScheduler::reset(std::unique_ptr<FrameBackend> backend) {
    shutdown();
    if (!backend) {
        throw std::invalid_argument("frame scheduler needs a backend");
    }
    if (backend->slot_count() == 0) {
        throw std::invalid_argument("frame scheduler needs at least one frame slot");
    }
    backend_ = std::move(backend);
    state_ = SchedulerState::Running;
    slot_states_.assign(backend_->slot_count(), SlotState::Idle);
    images_in_flight_.assign(backend_->image_count(), std::nullopt);
    current_slot_ = 0;
    frame_number_ = 0;
    frames_presented_ = 0;
    rebuild_count_ = 0;
    minimized_ = false;
    resize_pending_ = false;
    rebuild_before_frame_ = false;
}

FrameStatus FrameScheduler::render(const Callbacks& callbacks) {
    if (!backend_ || state_ == SchedulerState::Destroying) {
        return FrameStatus::Stopped;
    }
    if (minimized_) {
        return FrameStatus::Minimized;
    }
    if (state_ == SchedulerState::SurfaceInvalid || rebuild_before_frame_) {
        if (!rebuild(callbacks)) {
            return FrameStatus::Minimized;
        }
    }

    const std::size_t slot = current_slot_;
    backend_->wait_slot(slot);

    slot_states_[slot] = SlotState::Acquiring;
    const AcquiredImage acquired = backend_->acquire_image(slot);
    if (acquired.status == SurfaceStatus::OutOfDate) {
        // The slot fence was not reset, so the next attempt can wait on it again.
        slot_states_[slot] = SlotState::Idle;
        state_ = SchedulerState::SurfaceInvalid;
        rebuild(callbacks);
        return FrameStatus::Skipped;
    }
    if (acquired.status == SurfaceStatus::Suboptimal) {
        resize_pending_ = true;
    }

    const uint32_t image = acquired.image_index;
    const std::optional<std::size_t> owner = images_in_flight_.at(image);
    if (owner && *owner != slot) {
        backend_->wait_slot(*owner);
    }
    images_in_flight_[image] = slot;

    slot_states_[slot] = SlotState::Recording;
    FrameContext ctx{};
    ctx.slot = slot;
    ctx.image_index = image;
    ctx.frame_number = frame_number_;
    if (callbacks.record) {
        callbacks.record(ctx);
    }

    backend_->reset_slot(slot);
    backend_->submit(slot, image);
    slot_states_[slot] = SlotState::Submitted;

    slot_states_[slot] = SlotState::Presenting;
    const SurfaceStatus presented = backend_->present(slot, image);
    slot_states_[slot] = SlotState::Idle;
    ++frame_number_;
    advance_slot();

    if (presented != SurfaceStatus::Ok) {
        state_ = SchedulerState::SurfaceInvalid;
    }
    if (presented != SurfaceStatus::OutOfDate) {
        ++frames_presented_;
    }
    if (state_ == SchedulerState::SurfaceInvalid || resize_pending_) {
        rebuild(callbacks);
    }
    return (presented == SurfaceStatus::OutOfDate) ? FrameStatus::Skipped : FrameStatus::Presented;
}

void FrameScheduler::notify_resize(uint32_t width, uint32_t height) {
    if (state_ == SchedulerState::Destroying) {
        return;
    }
    if (width == 0 || height == 0) {
        if (!minimized_) {
            std::cout << "[frame] surface has zero area, rendering suspended\n";
        }
        minimized_ = true;
        return;
    }
    if (minimized_) {
        std::cout << "[frame] surface restored to " << width << "x" << height << "\n";
        minimized_ = false;
        rebuild_before_frame_ = true;
        return;
    }
    resize_pending_ = true;
}

void FrameScheduler::shutdown() {
    if (!backend_) {
        return;
    }
    state_ = SchedulerState::Destroying;
    backend_->wait_idle();
    backend_.reset();
    slot_states_.clear();
    images_in_flight_.clear();
}

bool FrameScheduler::rebuild(const Callbacks& callbacks) {
    backend_->wait_idle();
    if (!backend_->rebuild_surface()) {
        minimized_ = true;
        state_ = SchedulerState::SurfaceInvalid;
        return false;
    }
    images_in_flight_.assign(backend_->image_count(), std::nullopt);
    resize_pending_ = false;
    rebuild_before_frame_ = false;
    state_ = SchedulerState::Running;
    ++rebuild_count_;
    std::cout << "[frame] swapchain rebuilt (images=" << images_in_flight_.size() << ")\n";
    if (callbacks.on_surface_rebuilt) {
        callbacks.on_surface_rebuilt();
    }
    return true;
}

void FrameScheduler::advance_slot() {
    current_slot_ = (current_slot_ + 1) % slot_states_.size();
}

} // namespace scribble
