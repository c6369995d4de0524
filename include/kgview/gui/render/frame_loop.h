#ifndef KGVIEW_FRAME_LOOP_H
#define KGVIEW_FRAME_LOOP_H

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace kgview {
namespace gui {

using FrameRequestId = std::uint64_t;
using FrameCallback = std::function<void(double timestamp_seconds)>;

// Display-refresh callback scheduling, in the shape of requestAnimationFrame.
class FrameScheduler {
public:
    virtual ~FrameScheduler() = default;

    virtual FrameRequestId RequestFrame(FrameCallback callback) = 0;
    virtual void CancelFrame(FrameRequestId id) = 0;
};

/*
 * FrameScheduler pumped by the owner of the display loop. Each RunFrame()
 * runs the callbacks requested before it started; requests made from
 * inside a callback wait for the next RunFrame().
 */
class FrameRequestQueue : public FrameScheduler {
public:
    FrameRequestId RequestFrame(FrameCallback callback) override;
    void CancelFrame(FrameRequestId id) override;

    // Returns the number of callbacks that ran.
    std::size_t RunFrame(double timestamp_seconds);
    std::size_t PendingCount() const;

private:
    struct Request {
        FrameRequestId id;
        FrameCallback callback;
    };

    std::vector<Request> pending_;
    std::vector<Request> running_;
    FrameRequestId next_id_ = 1;
};

/*
 * Per-frame driver with two states, stopped and running. While running,
 * every frame calls tick(dt) and then requests the next frame. Enable()
 * while running does nothing, so there is never more than one loop.
 */
class FrameLoop {
public:
    using TickCallback = std::function<void(float dt)>;

    FrameLoop(FrameScheduler& scheduler, TickCallback tick, float max_dt = 0.1f);
    ~FrameLoop();

    FrameLoop(const FrameLoop&) = delete;
    FrameLoop& operator=(const FrameLoop&) = delete;

    void Enable();
    void Disable();

    bool IsRunning() const { return running_; }
    bool HasPendingFrame() const { return pending_.has_value(); }
    std::uint64_t GetTickCount() const { return tick_count_; }

private:
    void Schedule();
    void OnFrame(double timestamp_seconds);

    FrameScheduler& scheduler_;
    TickCallback tick_;
    float max_dt_;

    bool running_ = false;
    std::optional<FrameRequestId> pending_;
    std::optional<double> last_timestamp_;
    std::uint64_t tick_count_ = 0;
};

} // namespace gui
} // namespace kgview

#endif // KGVIEW_FRAME_LOOP_H
