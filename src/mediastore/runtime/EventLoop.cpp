#include <mediastore/runtime/EventLoop.hpp>

#include <mediastore/log/TaggedLogger.hpp>

namespace MS {

auto EventLoop::queueMicrotask(Callback callback) -> void {
    microtasks_.push_back(std::move(callback));
}

auto EventLoop::runMicrotasks() -> std::size_t {
    std::size_t ran = 0;
    while (!microtasks_.empty()) {
        auto callback = std::move(microtasks_.front());
        microtasks_.pop_front();
        ++ran;
        if (callback)
            callback();
    }
    return ran;
}

auto EventLoop::setTimeout(Callback callback, Duration delay) -> Id {
    auto const id       = nextId_++;
    auto const deadline = now_ + (delay.count() < 0 ? Duration{0} : delay);
    timers_.emplace(TimerKey{deadline, id}, std::move(callback));
    timerDeadlines_.emplace(id, deadline);
    return id;
}

auto EventLoop::clearTimeout(Id id) -> bool {
    auto it = timerDeadlines_.find(id);
    if (it == timerDeadlines_.end())
        return false;
    timers_.erase(TimerKey{it->second, id});
    timerDeadlines_.erase(it);
    return true;
}

auto EventLoop::advance(Duration delta) -> std::size_t {
    auto const  target = now_ + delta;
    std::size_t ran    = runMicrotasks();
    while (!timers_.empty()) {
        auto it = timers_.begin();
        if (it->first.first > target)
            break;
        now_          = it->first.first;
        auto callback = std::move(it->second);
        timerDeadlines_.erase(it->first.second);
        timers_.erase(it);
        ++ran;
        if (callback)
            callback();
        ran += runMicrotasks();
    }
    now_ = target;
    ms_log("EventLoop advanced", "EventLoop");
    return ran;
}

auto EventLoop::requestAnimationFrame(Callback callback) -> Id {
    auto const id = nextId_++;
    frames_.emplace(id, std::move(callback));
    return id;
}

auto EventLoop::cancelAnimationFrame(Id id) -> bool {
    return frames_.erase(id) > 0;
}

auto EventLoop::runFrame() -> std::size_t {
    auto ran = runMicrotasks();
    return ran + runBatch(frames_);
}

auto EventLoop::requestIdleCallback(Callback callback) -> Id {
    auto const id = nextId_++;
    idle_.emplace(id, std::move(callback));
    return id;
}

auto EventLoop::cancelIdleCallback(Id id) -> bool {
    return idle_.erase(id) > 0;
}

auto EventLoop::runIdle() -> std::size_t {
    auto ran = runMicrotasks();
    return ran + runBatch(idle_);
}

auto EventLoop::runBatch(std::map<Id, Callback>& queue) -> std::size_t {
    if (queue.empty())
        return 0;
    // Only callbacks registered before this batch started belong to it.
    auto const  last = queue.rbegin()->first;
    std::size_t ran  = 0;
    while (!queue.empty()) {
        auto it = queue.begin();
        if (it->first > last)
            break;
        auto callback = std::move(it->second);
        queue.erase(it);
        ++ran;
        if (callback)
            callback();
        ran += runMicrotasks();
    }
    return ran;
}

auto EventLoop::hasRunnableWork() const -> bool {
    return !microtasks_.empty() || !frames_.empty() || !idle_.empty();
}

auto EventLoop::runUntilIdle() -> std::size_t {
    std::size_t ran = 0;
    while (hasRunnableWork()) {
        ran += runMicrotasks();
        if (!frames_.empty()) {
            ran += runFrame();
            continue;
        }
        if (!idle_.empty())
            ran += runIdle();
    }
    return ran;
}

} // namespace MS
