#pragma once
#include <mediastore/core/Subscription.hpp>
#include <mediastore/core/Value.hpp>
#include <mediastore/runtime/EventLoop.hpp>
#include <mediastore/task/Scheduler.hpp>

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace MS {

/**
 * ReactiveState: observable name -> Value record with batched notification.
 *
 * Writes apply immediately; notification is deferred to the tree's scheduler
 * (or an explicit flush()) and coalesced. A key is reported as changed only
 * when its value at flush time differs from its value at the previous flush,
 * so writes that return a key to its old value produce no notification.
 *
 * Nested states assigned into a key are adopted: they share the parent's
 * change tracker, and a net change inside them reports the holding key as
 * changed on the parent (and further up the chain). A nested state keeps its
 * first parent; assigning it under a second key or a second state stores the
 * value without adopting it. Parents hold children strongly, children hold a
 * weak back-reference.
 *
 * An observer exception does not stop delivery: every other observer of the
 * flush is still notified, then the first exception propagates out of flush().
 */
class ReactiveState : public std::enable_shared_from_this<ReactiveState> {
public:
    using Keys     = std::set<std::string, std::less<>>;
    using Listener = std::function<void(Keys const& changed)>;

    // Copies record giving every nested state a fresh copy. Nested states shared
    // between keys stay shared inside the copy and parent links are mirrored.
    static auto DeepCopy(Record const& record) -> Record;

    // Without a scheduler notifications only go out on flush().
    static auto Create(Record initial = {}, Scheduler scheduler = {}) -> std::shared_ptr<ReactiveState>;
    // Notifications go out at the end of the loop's current microtask turn.
    static auto Create(EventLoop& loop, Record initial = {}) -> std::shared_ptr<ReactiveState>;

    ReactiveState(ReactiveState const&)            = delete;
    ReactiveState& operator=(ReactiveState const&) = delete;

    [[nodiscard]] auto get(std::string_view key) const -> Value;
    template <typename T>
    [[nodiscard]] auto get(std::string_view key) const -> Expected<T> {
        return get(key).template as<T>();
    }
    [[nodiscard]] auto contains(std::string_view key) const -> bool;
    [[nodiscard]] auto keys() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const -> std::size_t { return values_.size(); }

    // Shallow copy of the current record. Nested values share their state.
    [[nodiscard]] auto snapshot() const -> Record { return values_; }

    // Returns false when value is the same as the stored one.
    auto set(std::string const& key, Value value) -> bool;
    // Shallow merge. Returns the number of keys whose stored value changed.
    auto patch(Record const& partial) -> std::size_t;
    auto remove(std::string_view key) -> bool;
    // Writes defaults back. A nested state this container owns under a key is
    // restored in place when the default is nested too; other values are
    // replaced by deep copies. Keys absent from defaults are left alone.
    auto restore(Record const& defaults) -> std::size_t;

    auto subscribe(Listener listener) -> Subscription;
    // Fires only when one of keys changed.
    auto subscribe(Keys keys, Listener listener) -> Subscription;
    [[nodiscard]] auto observerCount() const -> std::size_t { return observers_.size(); }

    // Defers every notification of the tree until fn returns.
    template <typename Fn>
    auto batch(Fn&& fn) -> std::invoke_result_t<Fn>;

    // Delivers pending notifications of the whole tree synchronously.
    auto flush() -> void;
    [[nodiscard]] auto hasPendingChanges() const -> bool;

    [[nodiscard]] auto parent() const -> std::shared_ptr<ReactiveState> { return parent_.lock(); }
    [[nodiscard]] auto parentKey() const -> std::string const& { return parentKey_; }

private:
    struct Tracker {
        Scheduler                                 scheduler;
        int                                       batchDepth     = 0;
        bool                                      flushScheduled = false;
        SchedulerCancel                           cancelFlush;
        std::vector<std::weak_ptr<ReactiveState>> dirty;
    };

    struct Observer {
        std::optional<Keys> keys;
        Listener            listener;
    };

    using CopyMap = std::map<ReactiveState const*, std::shared_ptr<ReactiveState>>;

    explicit ReactiveState(Scheduler scheduler);

    static auto copyRecord(Record const& record, CopyMap& copies) -> Record;
    static auto copyValue(Value const& value, CopyMap& copies) -> Value;
    auto restoreInto(Record const& defaults, CopyMap& copies, std::set<ReactiveState const*>& visited) -> std::size_t;

    auto tracker() const -> std::shared_ptr<Tracker>;
    auto adopt(std::string const& key, Value const& value) -> void;
    auto release(std::string_view key, Value const& value) -> void;
    auto isSelfOrAncestor(ReactiveState const* state) const -> bool;
    auto recordBaseline(std::string_view key) -> void;
    auto markDirty() -> void;
    auto takeChanges() -> Keys;
    // Calls every matching observer. The first observer exception is stored in failure.
    auto notify(Keys const& changed, std::exception_ptr& failure) -> void;
    auto addObserver(Observer observer) -> Subscription;

    auto beginBatch() -> std::shared_ptr<Tracker>;
    static auto endBatch(std::shared_ptr<Tracker> const& tracker) -> void;

    static auto scheduleFlush(std::shared_ptr<Tracker> const& tracker) -> void;
    static auto flushTracker(std::shared_ptr<Tracker> const& tracker) -> void;

    Record                                                    values_;
    std::map<std::string, std::optional<Value>, std::less<>> baseline_;
    bool                                                      dirty_ = false;
    std::weak_ptr<ReactiveState>                              parent_;
    std::string                                               parentKey_;
    std::shared_ptr<Tracker>                                  tracker_;
    std::map<std::uint64_t, Observer>                         observers_;
    std::uint64_t                                             nextObserverId_ = 1;
};

template <typename Fn>
auto ReactiveState::batch(Fn&& fn) -> std::invoke_result_t<Fn> {
    using Result = std::invoke_result_t<Fn>;
    auto const tracker = beginBatch();
    if constexpr (std::is_void_v<Result>) {
        try {
            std::forward<Fn>(fn)();
        } catch (...) {
            endBatch(tracker);
            throw;
        }
        endBatch(tracker);
    } else {
        Result result = [&]() -> Result {
            try {
                return std::forward<Fn>(fn)();
            } catch (...) {
                endBatch(tracker);
                throw;
            }
        }();
        endBatch(tracker);
        return result;
    }
}

} // namespace MS
