#include <mediastore/task/Scheduler.hpp>

#include <memory>

namespace MS::Schedulers {

auto immediate() -> Scheduler {
    return [](std::function<void()> flush) -> SchedulerCancel {
        if (flush)
            flush();
        return {};
    };
}

auto microtask(EventLoop& loop) -> Scheduler {
    return [&loop](std::function<void()> flush) -> SchedulerCancel {
        auto cancelled = std::make_shared<bool>(false);
        loop.queueMicrotask([cancelled, flush = std::move(flush)] {
            if (!*cancelled && flush)
                flush();
        });
        return [cancelled] { *cancelled = true; };
    };
}

auto animationFrame(EventLoop& loop) -> Scheduler {
    return [&loop](std::function<void()> flush) -> SchedulerCancel {
        auto const id = loop.requestAnimationFrame(std::move(flush));
        return [&loop, id] { loop.cancelAnimationFrame(id); };
    };
}

auto idle(EventLoop& loop) -> Scheduler {
    return [&loop](std::function<void()> flush) -> SchedulerCancel {
        auto const id = loop.requestIdleCallback(std::move(flush));
        return [&loop, id] { loop.cancelIdleCallback(id); };
    };
}

auto delay(EventLoop& loop, std::chrono::milliseconds delay) -> Scheduler {
    return [&loop, delay](std::function<void()> flush) -> SchedulerCancel {
        auto const id = loop.setTimeout(std::move(flush), delay);
        return [&loop, id] { loop.clearTimeout(id); };
    };
}

} // namespace MS::Schedulers
