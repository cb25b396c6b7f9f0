#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

namespace MS {

/**
 * EventLoop: single-threaded cooperative host loop.
 *
 * Everything in the engine runs on the thread that pumps this loop. The loop
 * never runs on its own: the embedding application (or a test) drives it by
 * calling runMicrotasks(), advance(), runFrame(), runIdle() or runUntilIdle().
 *
 * Ordering
 * --------
 * - Microtasks run FIFO; microtasks queued while draining run in the same drain.
 * - After every timer, frame or idle callback the microtask queue is drained.
 * - Timers use a virtual clock that only moves through advance(); timers with
 *   equal deadlines fire in scheduling order.
 * - Frame and idle callbacks requested while their batch is running are
 *   deferred to the next runFrame()/runIdle().
 *
 * Exceptions thrown by callbacks propagate to the caller of the run method.
 * The throwing callback has already been removed from its queue.
 */
class EventLoop {
public:
    using Callback = std::function<void()>;
    using Id       = std::uint64_t;
    using Duration = std::chrono::milliseconds;

    EventLoop()  = default;
    ~EventLoop() = default;

    EventLoop(EventLoop const&)            = delete;
    EventLoop& operator=(EventLoop const&) = delete;

    auto queueMicrotask(Callback callback) -> void;
    auto runMicrotasks() -> std::size_t;

    auto setTimeout(Callback callback, Duration delay) -> Id;
    auto clearTimeout(Id id) -> bool;
    // Moves the virtual clock forward, firing due timers in deadline order.
    auto advance(Duration delta) -> std::size_t;

    auto requestAnimationFrame(Callback callback) -> Id;
    auto cancelAnimationFrame(Id id) -> bool;
    auto runFrame() -> std::size_t;

    auto requestIdleCallback(Callback callback) -> Id;
    auto cancelIdleCallback(Id id) -> bool;
    auto runIdle() -> std::size_t;

    // Drains microtasks, frames and idle callbacks until only future timers remain.
    auto runUntilIdle() -> std::size_t;

    [[nodiscard]] auto now() const -> Duration { return now_; }
    [[nodiscard]] auto pendingMicrotasks() const -> std::size_t { return microtasks_.size(); }
    [[nodiscard]] auto pendingTimers() const -> std::size_t { return timers_.size(); }
    [[nodiscard]] auto pendingFrames() const -> std::size_t { return frames_.size(); }
    [[nodiscard]] auto pendingIdle() const -> std::size_t { return idle_.size(); }
    [[nodiscard]] auto hasRunnableWork() const -> bool;

private:
    using TimerKey = std::pair<Duration, Id>;

    auto runBatch(std::map<Id, Callback>& queue) -> std::size_t;

    std::deque<Callback>             microtasks_;
    std::map<TimerKey, Callback>     timers_;
    std::unordered_map<Id, Duration> timerDeadlines_;
    std::map<Id, Callback>           frames_;
    std::map<Id, Callback>           idle_;
    Duration                         now_{0};
    Id                               nextId_ = 1;
};

} // namespace MS
