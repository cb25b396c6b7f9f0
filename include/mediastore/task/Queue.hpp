#pragma once
#include <mediastore/core/Subscription.hpp>
#include <mediastore/core/Value.hpp>
#include <mediastore/log/TaggedLogger.hpp>
#include <mediastore/runtime/EventLoop.hpp>
#include <mediastore/task/AbortSignal.hpp>
#include <mediastore/task/Future.hpp>
#include <mediastore/task/Scheduler.hpp>
#include <mediastore/task/TaskInfo.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MS {

struct TaskContext {
    Value                      input;
    AbortSignal                signal;
    std::optional<RequestMeta> meta;
};

struct QueueTask {
    using Handler = std::function<Future<Value>(TaskContext const&)>;

    std::string                name;
    std::string                key; // empty: the task name is the key
    TaskMode                   mode = TaskMode::Exclusive;
    Value                      input;
    std::optional<RequestMeta> meta;
    Scheduler                  schedule; // empty: QueueOptions::scheduler
    Handler                    handler;
};

struct QueueOptions {
    using Clock = std::function<std::chrono::milliseconds()>;

    Scheduler                                                            scheduler; // empty: microtask on the queue's loop
    std::function<void(TaskInfo const&)>                                 onDispatch;
    std::function<void(TaskInfo const&, TaskOutcome, std::chrono::milliseconds)> onSettled;
    std::shared_ptr<LogSink>                                             logger; // empty: defaultErrorSink()
    Clock                                                                clock;  // empty: the loop's virtual clock
};

/**
 * Queue: runs named asynchronous tasks with key-based exclusivity.
 *
 * Every enqueue resolves a key. An exclusive task aborts every live task that
 * shares its key before it is scheduled: tasks that have not started are
 * cancelled without running their handler, running tasks have their signal
 * aborted. In both cases the signal fires before the old promise rejects with
 * Superseded. Shared tasks never cancel anything.
 *
 * Task records are kept by name in tasks() with the status machine
 * idle -> pending -> success | error, and survive until reset() or destroy().
 * Listeners registered with subscribe() run after every record change.
 */
class Queue {
public:
    using TaskMap  = std::map<std::string, TaskInfo, std::less<>>;
    using Listener = std::function<void(TaskMap const&)>;

    explicit Queue(EventLoop& loop, QueueOptions options = {});
    ~Queue();

    Queue(Queue const&)            = delete;
    Queue& operator=(Queue const&) = delete;

    auto enqueue(QueueTask task) -> Future<Value>;

    // Aborts every live task under key. Returns how many were aborted.
    auto abort(std::string_view key) -> std::size_t;
    // Aborts every live task.
    auto abort() -> std::size_t;

    // Clears settled records. Pending records are left untouched.
    auto reset(std::string_view name) -> bool;
    auto reset() -> std::size_t;

    auto subscribe(Listener listener) -> Subscription;

    // Terminal. Aborts everything, drops records and listeners. Idempotent.
    auto destroy() -> void;

    [[nodiscard]] auto destroyed() const -> bool { return destroyed_; }
    [[nodiscard]] auto tasks() const -> TaskMap const& { return tasks_; }
    [[nodiscard]] auto task(std::string_view name) const -> std::optional<TaskInfo>;
    [[nodiscard]] auto status(std::string_view name) const -> TaskStatus;
    [[nodiscard]] auto activeCount() const -> std::size_t { return active_.size(); }
    [[nodiscard]] auto activeCount(std::string_view key) const -> std::size_t;
    [[nodiscard]] auto loop() const -> EventLoop& { return loop_; }

private:
    struct Entry {
        TaskInfo           info;
        QueueTask::Handler handler;
        Promise<Value>     promise;
        AbortController    controller;
        SchedulerCancel    cancelSchedule;
        bool               settled = false;
    };
    using EntryPtr = std::shared_ptr<Entry>;

    auto execute(EntryPtr const& entry) -> void;
    auto cancel(EntryPtr const& entry, Error reason) -> void;
    auto settle(EntryPtr const& entry, Expected<Value> result) -> void;
    auto cancelWhere(std::function<bool(Entry const&)> const& predicate, Error const& reason) -> std::size_t;
    auto notify() -> void;
    auto now() const -> std::chrono::milliseconds;
    auto report(std::string const& message) const -> void;

    EventLoop&                        loop_;
    QueueOptions                      options_;
    std::vector<EntryPtr>             active_;
    TaskMap                           tasks_;
    std::map<std::uint64_t, Listener> listeners_;
    std::uint64_t                     nextListenerId_ = 1;
    std::uint64_t                     nextTaskId_     = 1;
    bool                              destroyed_      = false;
    // Callbacks scheduled on the loop hold a weak reference and bail out once the queue is gone.
    std::shared_ptr<Queue*> self_;
};

} // namespace MS
