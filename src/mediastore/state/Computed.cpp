#include <mediastore/state/Computed.hpp>

#include <utility>
#include <vector>

namespace MS {

Computed::Computed(std::shared_ptr<ReactiveState> state, ReactiveState::Keys keys, Derive derive)
    : state_(std::move(state)), keys_(std::move(keys)), derive_(std::move(derive)), self_(std::make_shared<Computed*>(this)) {
    compute();
    if (!state_)
        return;
    stateSubscription_ = state_->subscribe(keys_, [weak = std::weak_ptr<Computed*>(self_)](ReactiveState::Keys const&) {
        auto self = weak.lock();
        if (!self)
            return;
        auto& computed = **self;
        if (!computed.compute())
            return;
        std::vector<std::uint64_t> ids;
        for (auto const& [id, listener] : computed.listeners_)
            ids.push_back(id);
        for (auto id : ids) {
            auto it = computed.listeners_.find(id);
            if (it == computed.listeners_.end())
                continue;
            auto listener = it->second;
            listener(computed.cached_);
        }
    });
}

auto Computed::current() -> Value const& {
    if (!initialized_)
        compute();
    return cached_;
}

auto Computed::subscribe(Listener listener) -> Subscription {
    if (!listener)
        return Subscription{};
    auto const id = nextId_++;
    listeners_.emplace(id, std::move(listener));
    return Subscription{[weak = std::weak_ptr<Computed*>(self_), id] {
        if (auto self = weak.lock())
            (*self)->listeners_.erase(id);
    }};
}

auto Computed::destroy() -> void {
    stateSubscription_.unsubscribe();
    listeners_.clear();
}

auto Computed::compute() -> bool {
    Record selected;
    if (state_) {
        for (auto const& key : keys_)
            selected.insert_or_assign(key, state_->get(key));
    }
    auto next          = derive_ ? derive_(selected) : Value{};
    auto const changed = !initialized_ || !sameValue(cached_, next);
    cached_            = std::move(next);
    initialized_       = true;
    return changed;
}

} // namespace MS
