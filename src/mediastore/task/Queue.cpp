#include <mediastore/task/Queue.hpp>

#include <algorithm>
#include <exception>
#include <source_location>
#include <utility>

namespace MS {

Queue::Queue(EventLoop& loop, QueueOptions options)
    : loop_(loop), options_(std::move(options)), self_(std::make_shared<Queue*>(this)) {
    if (!options_.scheduler)
        options_.scheduler = Schedulers::microtask(loop_);
    if (!options_.logger)
        options_.logger = defaultErrorSink();
}

Queue::~Queue() {
    // Settle outstanding promises before the entries disappear.
    destroy();
}

auto Queue::enqueue(QueueTask task) -> Future<Value> {
    if (destroyed_)
        return Future<Value>::Rejected(Error{Error::Code::Destroyed, "queue destroyed"});

    if (task.key.empty())
        task.key = task.name;

    if (task.mode == TaskMode::Exclusive) {
        auto const& key = task.key;
        cancelWhere([&key](Entry const& entry) { return entry.info.key == key; },
                    Error{Error::Code::Superseded, "superseded by " + task.name});
    }

    auto entry              = std::make_shared<Entry>();
    entry->info.id          = nextTaskId_++;
    entry->info.name        = std::move(task.name);
    entry->info.key         = std::move(task.key);
    entry->info.mode        = task.mode;
    entry->info.status      = TaskStatus::Pending;
    entry->info.input       = std::move(task.input);
    entry->info.meta        = std::move(task.meta);
    entry->info.enqueuedAt  = now();
    entry->handler          = std::move(task.handler);
    auto future             = entry->promise.future();

    ms_log("Queue enqueue " + entry->info.name + " key=" + entry->info.key, "Queue");

    active_.push_back(entry);
    tasks_.insert_or_assign(entry->info.name, entry->info);
    notify();

    auto const& scheduler = task.schedule ? task.schedule : options_.scheduler;
    auto        cancelFn  = scheduler([weak = std::weak_ptr<Queue*>(self_), weakEntry = std::weak_ptr<Entry>(entry)] {
        auto self  = weak.lock();
        auto entry = weakEntry.lock();
        if (!self || !entry)
            return;
        (*self)->execute(entry);
    });
    if (!entry->info.started && !entry->settled)
        entry->cancelSchedule = std::move(cancelFn);
    return future;
}

auto Queue::execute(EntryPtr const& entry) -> void {
    if (entry->settled || entry->info.started)
        return;
    entry->cancelSchedule = nullptr;
    entry->info.started   = true;
    entry->info.startedAt = now();

    if (auto current = tasks_.find(entry->info.name); current != tasks_.end() && current->second.id == entry->info.id)
        current->second = entry->info;

    if (options_.onDispatch) {
        try {
            options_.onDispatch(entry->info);
        } catch (std::exception const& e) {
            report(std::string{"onDispatch hook failed: "} + e.what());
        }
    }

    if (auto check = entry->controller.signal().check(); !check) {
        settle(entry, std::unexpected(check.error()));
        return;
    }

    if (!entry->handler) {
        settle(entry, Value{});
        return;
    }

    Future<Value> result;
    try {
        result = entry->handler(TaskContext{.input = entry->info.input, .signal = entry->controller.signal(), .meta = entry->info.meta});
    } catch (std::exception const& e) {
        settle(entry, std::unexpected(Error{Error::Code::HandlerError, e.what()}));
        return;
    } catch (...) {
        settle(entry, std::unexpected(Error{Error::Code::HandlerError, "unknown exception"}));
        return;
    }

    if (!result.valid()) {
        settle(entry, Value{});
        return;
    }

    result.then([weak = std::weak_ptr<Queue*>(self_), weakEntry = std::weak_ptr<Entry>(entry)](Expected<Value> const& outcome) {
        auto self  = weak.lock();
        auto entry = weakEntry.lock();
        if (!self || !entry)
            return;
        (*self)->settle(entry, outcome);
    });
}

auto Queue::cancel(EntryPtr const& entry, Error reason) -> void {
    if (entry->settled)
        return;
    // Signal first so in-flight handlers observe the abort before the promise rejects.
    entry->controller.abort(reason);
    settle(entry, std::unexpected(std::move(reason)));
}

auto Queue::cancelWhere(std::function<bool(Entry const&)> const& predicate, Error const& reason) -> std::size_t {
    std::vector<EntryPtr> matches;
    std::copy_if(active_.begin(), active_.end(), std::back_inserter(matches), [&](EntryPtr const& entry) { return predicate(*entry); });
    for (auto const& entry : matches)
        cancel(entry, reason);
    return matches.size();
}

auto Queue::settle(EntryPtr const& entry, Expected<Value> result) -> void {
    if (entry->settled)
        return;
    entry->settled = true;
    if (auto cancelSchedule = std::exchange(entry->cancelSchedule, nullptr))
        cancelSchedule();
    std::erase(active_, entry);

    auto& info     = entry->info;
    info.settledAt = now();
    if (result) {
        info.status = TaskStatus::Success;
        info.output = *result;
    } else {
        info.status    = TaskStatus::Error;
        info.error     = result.error();
        info.cancelled = isCancellation(result.error()) || entry->controller.aborted();
    }

    ms_log("Queue settled " + info.name + " " + std::string{taskStatusToString(info.status)}, "Queue");

    if (!destroyed_) {
        if (auto current = tasks_.find(info.name); current != tasks_.end() && current->second.id == info.id) {
            current->second = info;
            notify();
        }
    }

    if (info.started && options_.onSettled) {
        auto const outcome = result ? TaskOutcome::Success : (info.cancelled ? TaskOutcome::Cancelled : TaskOutcome::Error);
        try {
            options_.onSettled(info, outcome, info.settledAt - info.startedAt);
        } catch (std::exception const& e) {
            report(std::string{"onSettled hook failed: "} + e.what());
        }
    }

    entry->promise.settle(std::move(result));
}

auto Queue::abort(std::string_view key) -> std::size_t {
    return cancelWhere([key](Entry const& entry) { return entry.info.key == key; },
                       Error{Error::Code::Aborted, "aborted"});
}

auto Queue::abort() -> std::size_t {
    return cancelWhere([](Entry const&) { return true; }, Error{Error::Code::Aborted, "aborted"});
}

auto Queue::reset(std::string_view name) -> bool {
    auto it = tasks_.find(name);
    if (it == tasks_.end() || it->second.pending())
        return false;
    tasks_.erase(it);
    notify();
    return true;
}

auto Queue::reset() -> std::size_t {
    auto const cleared = std::erase_if(tasks_, [](auto const& item) { return !item.second.pending(); });
    if (cleared > 0)
        notify();
    return cleared;
}

auto Queue::subscribe(Listener listener) -> Subscription {
    if (destroyed_ || !listener)
        return Subscription{};
    auto const id = nextListenerId_++;
    listeners_.emplace(id, std::move(listener));
    return Subscription{[weak = std::weak_ptr<Queue*>(self_), id] {
        if (auto self = weak.lock())
            (*self)->listeners_.erase(id);
    }};
}

auto Queue::destroy() -> void {
    if (destroyed_)
        return;
    destroyed_ = true;
    ms_log("Queue destroyed", "Queue");
    cancelWhere([](Entry const&) { return true; }, Error{Error::Code::Aborted, "queue destroyed"});
    listeners_.clear();
    tasks_.clear();
}

auto Queue::task(std::string_view name) const -> std::optional<TaskInfo> {
    if (auto it = tasks_.find(name); it != tasks_.end())
        return it->second;
    return std::nullopt;
}

auto Queue::status(std::string_view name) const -> TaskStatus {
    if (auto it = tasks_.find(name); it != tasks_.end())
        return it->second.status;
    return TaskStatus::Idle;
}

auto Queue::activeCount(std::string_view key) const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(active_.begin(), active_.end(), [key](EntryPtr const& entry) { return entry->info.key == key; }));
}

auto Queue::notify() -> void {
    if (listeners_.empty())
        return;
    auto ids = std::vector<std::uint64_t>{};
    ids.reserve(listeners_.size());
    for (auto const& [id, listener] : listeners_)
        ids.push_back(id);
    auto const snapshot = tasks_;
    for (auto id : ids) {
        auto it = listeners_.find(id);
        if (it == listeners_.end())
            continue;
        auto listener = it->second;
        try {
            listener(snapshot);
        } catch (std::exception const& e) {
            report(std::string{"queue listener failed: "} + e.what());
        }
    }
}

auto Queue::now() const -> std::chrono::milliseconds {
    return options_.clock ? options_.clock() : loop_.now();
}

auto Queue::report(std::string const& message) const -> void {
    options_.logger->log(message, {"Queue", "Error"}, std::source_location::current());
}

} // namespace MS
