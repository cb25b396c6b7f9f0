#pragma once
#include <mediastore/runtime/EventLoop.hpp>

#include <chrono>
#include <functional>

namespace MS {

// Cancels a scheduled flush. Empty when the scheduler cannot cancel.
using SchedulerCancel = std::function<void()>;

// Decides when a flush runs. Returns a canceller for flushes that have not run yet.
using Scheduler = std::function<SchedulerCancel(std::function<void()>)>;

/**
 * Stock schedulers over the host EventLoop. The loop must outlive every
 * scheduler built from it. Cancelling after the flush ran is a no-op.
 */
namespace Schedulers {

// Runs the flush synchronously inside the scheduling call.
auto immediate() -> Scheduler;
// End of the current synchronous turn.
auto microtask(EventLoop& loop) -> Scheduler;
auto animationFrame(EventLoop& loop) -> Scheduler;
auto idle(EventLoop& loop) -> Scheduler;
auto delay(EventLoop& loop, std::chrono::milliseconds delay) -> Scheduler;

} // namespace Schedulers

} // namespace MS
