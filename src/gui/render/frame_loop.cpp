#include <kgview/gui/render/frame_loop.h>

#include <algorithm>

namespace kgview {
namespace gui {

FrameRequestId FrameRequestQueue::RequestFrame(FrameCallback callback) {
    const FrameRequestId id = next_id_++;
    pending_.push_back(Request{id, std::move(callback)});
    return id;
}

void FrameRequestQueue::CancelFrame(FrameRequestId id) {
    auto matches = [id](const Request& r) { return r.id == id; };
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(), matches), pending_.end());

    // A request already picked up by the current RunFrame() is disarmed in place.
    for (auto& request : running_) {
        if (request.id == id) request.callback = nullptr;
    }
}

std::size_t FrameRequestQueue::RunFrame(double timestamp_seconds) {
    running_.clear();
    running_.swap(pending_);

    std::size_t ran = 0;
    for (std::size_t i = 0; i < running_.size(); ++i) {
        FrameCallback callback = std::move(running_[i].callback);
        if (!callback) continue;
        running_[i].callback = nullptr;
        callback(timestamp_seconds);
        ++ran;
    }
    running_.clear();
    return ran;
}

std::size_t FrameRequestQueue::PendingCount() const {
    return pending_.size();
}

FrameLoop::FrameLoop(FrameScheduler& scheduler, TickCallback tick, float max_dt)
    : scheduler_(scheduler), tick_(std::move(tick)), max_dt_(max_dt) {}

FrameLoop::~FrameLoop() {
    Disable();
}

void FrameLoop::Enable() {
    if (running_) return;
    running_ = true;
    last_timestamp_.reset();
    Schedule();
}

void FrameLoop::Disable() {
    running_ = false;
    if (pending_) {
        scheduler_.CancelFrame(*pending_);
        pending_.reset();
    }
}

void FrameLoop::Schedule() {
    if (pending_) return;
    pending_ = scheduler_.RequestFrame([this](double timestamp) { OnFrame(timestamp); });
}

void FrameLoop::OnFrame(double timestamp_seconds) {
    pending_.reset();
    if (!running_) return;

    float dt = 0.0f;
    if (last_timestamp_) {
        dt = std::clamp(static_cast<float>(timestamp_seconds - *last_timestamp_), 0.0f, max_dt_);
    }
    last_timestamp_ = timestamp_seconds;

    ++tick_count_;
    if (tick_) tick_(dt);

    if (running_) Schedule();
}

} // namespace gui
} // namespace kgview
