#include <mediastore/task/AbortSignal.hpp>

#include <mediastore/log/TaggedLogger.hpp>

#include <utility>
#include <vector>

namespace MS {

auto AbortSignal::aborted() const -> bool {
    return state_ && state_->aborted;
}

auto AbortSignal::reason() const -> std::optional<Error> {
    if (!state_)
        return std::nullopt;
    return state_->reason;
}

auto AbortSignal::check() const -> Expected<void> {
    if (state_ && state_->aborted)
        return std::unexpected(state_->reason.value_or(Error{Error::Code::Aborted, "aborted"}));
    return {};
}

auto AbortSignal::addListener(Listener listener) const -> Subscription {
    if (!state_ || !listener)
        return Subscription{};
    if (state_->aborted) {
        listener(*state_->reason);
        return Subscription{};
    }
    auto const id = state_->nextId++;
    state_->listeners.emplace(id, std::move(listener));
    return Subscription{[weak = std::weak_ptr<State>(state_), id] {
        if (auto state = weak.lock())
            state->listeners.erase(id);
    }};
}

auto AbortSignal::listenerCount() const -> std::size_t {
    return state_ ? state_->listeners.size() : 0;
}

AbortController::AbortController()
    : signal_(std::make_shared<AbortSignal::State>()) {}

auto AbortController::abort(Error reason) -> bool {
    auto& state = *signal_.state_;
    if (state.aborted)
        return false;
    state.aborted = true;
    state.reason  = std::move(reason);
    ms_log("AbortController fired: " + describeError(*state.reason), "Abort");

    auto listeners = std::exchange(state.listeners, {});
    // Keep the state alive while listeners drop their own handles to it.
    auto keepAlive = signal_.state_;
    for (auto& [id, listener] : listeners)
        listener(*keepAlive->reason);
    return true;
}

auto AbortController::follow(AbortSignal const& parent) -> Subscription {
    return parent.addListener([weak = std::weak_ptr<AbortSignal::State>(signal_.state_)](Error const& reason) {
        auto state = weak.lock();
        if (!state)
            return;
        AbortController controller{AbortSignal{state}};
        controller.abort(reason);
    });
}

auto releaseOnAbort(AbortSignal const& signal, Subscription subscription) -> void {
    if (signal.aborted()) {
        subscription.unsubscribe();
        return;
    }
    auto held = std::make_shared<Subscription>(std::move(subscription));
    // The listener registration lives in the signal until it fires.
    auto registration = signal.addListener([held](Error const&) { held->unsubscribe(); });
    registration.detach();
}

} // namespace MS
