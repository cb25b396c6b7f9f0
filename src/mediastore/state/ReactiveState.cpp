#include <mediastore/state/ReactiveState.hpp>

#include <mediastore/log/TaggedLogger.hpp>

#include <algorithm>
#include <utility>

namespace MS {

ReactiveState::ReactiveState(Scheduler scheduler)
    : tracker_(std::make_shared<Tracker>()) {
    tracker_->scheduler = std::move(scheduler);
}

auto ReactiveState::Create(Record initial, Scheduler scheduler) -> std::shared_ptr<ReactiveState> {
    auto state     = std::shared_ptr<ReactiveState>(new ReactiveState(std::move(scheduler)));
    state->values_ = std::move(initial);
    for (auto const& [key, value] : state->values_)
        state->adopt(key, value);
    return state;
}

auto ReactiveState::Create(EventLoop& loop, Record initial) -> std::shared_ptr<ReactiveState> {
    return Create(std::move(initial), Schedulers::microtask(loop));
}

auto ReactiveState::get(std::string_view key) const -> Value {
    if (auto it = values_.find(key); it != values_.end())
        return it->second;
    return Value{};
}

auto ReactiveState::contains(std::string_view key) const -> bool {
    return values_.find(key) != values_.end();
}

auto ReactiveState::keys() const -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(values_.size());
    for (auto const& [key, value] : values_)
        result.push_back(key);
    return result;
}

auto ReactiveState::set(std::string const& key, Value value) -> bool {
    auto it = values_.find(key);
    if (it != values_.end() && sameValue(it->second, value))
        return false;

    recordBaseline(key);
    if (it != values_.end()) {
        auto previous = std::exchange(it->second, std::move(value));
        release(key, previous);
        adopt(key, it->second);
    } else {
        auto [inserted, ok] = values_.emplace(key, std::move(value));
        adopt(key, inserted->second);
    }
    ms_log("State set " + key, "State");
    markDirty();
    return true;
}

auto ReactiveState::patch(Record const& partial) -> std::size_t {
    std::size_t changed = 0;
    for (auto const& [key, value] : partial) {
        if (set(key, value))
            ++changed;
    }
    return changed;
}

auto ReactiveState::remove(std::string_view key) -> bool {
    auto it = values_.find(key);
    if (it == values_.end())
        return false;
    recordBaseline(key);
    auto previous = std::move(it->second);
    auto name     = it->first;
    values_.erase(it);
    release(name, previous);
    markDirty();
    return true;
}

auto ReactiveState::DeepCopy(Record const& record) -> Record {
    CopyMap copies;
    return copyRecord(record, copies);
}

auto ReactiveState::copyRecord(Record const& record, CopyMap& copies) -> Record {
    Record result;
    for (auto const& [key, value] : record)
        result.emplace(key, copyValue(value, copies));
    return result;
}

auto ReactiveState::copyValue(Value const& value, CopyMap& copies) -> Value {
    auto source = value.nested();
    if (!source)
        return value;
    if (auto it = copies.find(source.get()); it != copies.end())
        return Value{it->second};

    auto copy = std::shared_ptr<ReactiveState>(new ReactiveState(Scheduler{}));
    copies.emplace(source.get(), copy);
    copy->values_ = copyRecord(source->values_, copies);
    // Children copied under this call point back at their copied parent.
    for (auto const& [key, child] : copy->values_) {
        auto nested = child.nested();
        if (!nested || !nested->parent_.expired())
            continue;
        auto original = source->values_.find(key);
        auto owner    = original->second.nested();
        if (owner && owner->parentKey_ == key && owner->parent_.lock() == source) {
            nested->parent_    = copy;
            nested->parentKey_ = key;
        }
    }
    return Value{copy};
}

auto ReactiveState::restore(Record const& defaults) -> std::size_t {
    CopyMap                        copies;
    std::set<ReactiveState const*> visited;
    return restoreInto(defaults, copies, visited);
}

auto ReactiveState::restoreInto(Record const& defaults, CopyMap& copies, std::set<ReactiveState const*>& visited) -> std::size_t {
    if (!visited.insert(this).second)
        return 0;
    std::size_t changed = 0;
    for (auto const& [key, value] : defaults) {
        auto current = get(key).nested();
        auto initial = value.nested();
        if (current && initial && current->parentKey_ == key && current->parent_.lock().get() == this) {
            changed += current->restoreInto(initial->values_, copies, visited);
            continue;
        }
        if (set(key, copyValue(value, copies)))
            ++changed;
    }
    return changed;
}

auto ReactiveState::subscribe(Listener listener) -> Subscription {
    return addObserver(Observer{.keys = std::nullopt, .listener = std::move(listener)});
}

auto ReactiveState::subscribe(Keys keys, Listener listener) -> Subscription {
    return addObserver(Observer{.keys = std::move(keys), .listener = std::move(listener)});
}

auto ReactiveState::addObserver(Observer observer) -> Subscription {
    if (!observer.listener)
        return Subscription{};
    auto const id = nextObserverId_++;
    observers_.emplace(id, std::move(observer));
    return Subscription{[weak = weak_from_this(), id] {
        if (auto self = weak.lock())
            self->observers_.erase(id);
    }};
}

auto ReactiveState::flush() -> void {
    flushTracker(tracker());
}

auto ReactiveState::hasPendingChanges() const -> bool {
    return !tracker()->dirty.empty();
}

auto ReactiveState::tracker() const -> std::shared_ptr<Tracker> {
    auto const* root = this;
    auto        hold = std::shared_ptr<ReactiveState>{};
    while (auto parent = root->parent_.lock()) {
        hold = std::move(parent);
        root = hold.get();
    }
    return root->tracker_;
}

auto ReactiveState::isSelfOrAncestor(ReactiveState const* state) const -> bool {
    if (state == this)
        return true;
    for (auto parent = parent_.lock(); parent; parent = parent->parent_.lock()) {
        if (parent.get() == state)
            return true;
    }
    return false;
}

auto ReactiveState::adopt(std::string const& key, Value const& value) -> void {
    auto child = value.nested();
    if (!child || child->parent_.lock() || isSelfOrAncestor(child.get()))
        return;

    auto previous      = child->tracker();
    child->parent_     = weak_from_this();
    child->parentKey_  = key;
    auto const current = tracker();
    if (previous == current)
        return;

    // Pending changes of the adopted subtree now flush with this tree.
    if (auto cancel = std::exchange(previous->cancelFlush, nullptr))
        cancel();
    previous->flushScheduled = false;
    auto moved               = std::exchange(previous->dirty, {});
    if (moved.empty())
        return;
    current->dirty.insert(current->dirty.end(), moved.begin(), moved.end());
    if (current->batchDepth == 0)
        scheduleFlush(current);
}

auto ReactiveState::release(std::string_view key, Value const& value) -> void {
    auto child = value.nested();
    if (!child || child->parentKey_ != key || child->parent_.lock().get() != this)
        return;
    child->parent_.reset();
    child->parentKey_.clear();
}

auto ReactiveState::recordBaseline(std::string_view key) -> void {
    if (baseline_.find(key) != baseline_.end())
        return;
    auto it = values_.find(key);
    baseline_.emplace(std::string{key}, it != values_.end() ? std::optional<Value>{it->second} : std::nullopt);
}

auto ReactiveState::markDirty() -> void {
    auto const current = tracker();
    if (!dirty_) {
        dirty_ = true;
        current->dirty.push_back(weak_from_this());
    }
    if (current->batchDepth == 0)
        scheduleFlush(current);
}

auto ReactiveState::takeChanges() -> Keys {
    Keys changed;
    for (auto const& [key, before] : baseline_) {
        auto it = values_.find(key);
        if (!before.has_value()) {
            if (it != values_.end())
                changed.insert(key);
        } else if (it == values_.end() || !sameValue(*before, it->second)) {
            changed.insert(key);
        }
    }
    baseline_.clear();
    return changed;
}

auto ReactiveState::notify(Keys const& changed, std::exception_ptr& failure) -> void {
    std::vector<std::uint64_t> ids;
    ids.reserve(observers_.size());
    for (auto const& [id, observer] : observers_)
        ids.push_back(id);

    for (auto id : ids) {
        auto it = observers_.find(id);
        if (it == observers_.end())
            continue;
        auto const& keys = it->second.keys;
        if (keys && std::none_of(keys->begin(), keys->end(), [&changed](std::string const& key) { return changed.contains(key); }))
            continue;
        auto listener = it->second.listener;
        try {
            listener(changed);
        } catch (...) {
            if (!failure)
                failure = std::current_exception();
        }
    }
}

auto ReactiveState::beginBatch() -> std::shared_ptr<Tracker> {
    auto current = tracker();
    ++current->batchDepth;
    return current;
}

auto ReactiveState::endBatch(std::shared_ptr<Tracker> const& tracker) -> void {
    if (--tracker->batchDepth == 0 && !tracker->dirty.empty())
        scheduleFlush(tracker);
}

auto ReactiveState::scheduleFlush(std::shared_ptr<Tracker> const& tracker) -> void {
    if (tracker->flushScheduled || !tracker->scheduler)
        return;
    tracker->flushScheduled = true;
    auto cancel             = tracker->scheduler([weak = std::weak_ptr<Tracker>(tracker)] {
        auto current = weak.lock();
        if (!current || !current->flushScheduled)
            return;
        current->flushScheduled = false;
        current->cancelFlush    = nullptr;
        flushTracker(current);
    });
    if (tracker->flushScheduled)
        tracker->cancelFlush = std::move(cancel);
}

auto ReactiveState::flushTracker(std::shared_ptr<Tracker> const& tracker) -> void {
    if (tracker->flushScheduled) {
        if (auto cancel = std::exchange(tracker->cancelFlush, nullptr))
            cancel();
        tracker->flushScheduled = false;
    }

    auto dirty = std::exchange(tracker->dirty, {});
    if (dirty.empty())
        return;

    std::vector<std::shared_ptr<ReactiveState>> order;
    std::map<ReactiveState const*, Keys>        changes;
    auto                                        record = [&](std::shared_ptr<ReactiveState> const& state, Keys const& keys) {
        auto [it, inserted] = changes.try_emplace(state.get());
        if (inserted)
            order.push_back(state);
        it->second.insert(keys.begin(), keys.end());
    };

    for (auto const& weak : dirty) {
        auto state = weak.lock();
        if (!state)
            continue;
        state->dirty_ = false;
        auto keys     = state->takeChanges();
        if (keys.empty())
            continue;
        record(state, keys);
        auto child = state;
        for (auto parent = child->parent_.lock(); parent; parent = parent->parent_.lock()) {
            record(parent, Keys{child->parentKey_});
            child = parent;
        }
    }

    ms_log("State flush of " + std::to_string(order.size()) + " container(s)", "State");
    std::exception_ptr failure;
    for (auto const& state : order)
        state->notify(changes[state.get()], failure);
    if (failure)
        std::rethrow_exception(failure);
}

} // namespace MS
