#pragma once
#include <mediastore/core/Subscription.hpp>
#include <mediastore/core/Value.hpp>
#include <mediastore/state/ReactiveState.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>

namespace MS {

/**
 * Computed: a value derived from selected keys of a ReactiveState.
 *
 * The derivation reruns when one of the keys is reported changed. Listeners
 * are told only when the derived value differs (sameValue) from the cached one.
 */
class Computed {
public:
    using Derive   = std::function<Value(Record const& selected)>;
    using Listener = std::function<void(Value const&)>;

    Computed(std::shared_ptr<ReactiveState> state, ReactiveState::Keys keys, Derive derive);

    Computed(Computed const&)            = delete;
    Computed& operator=(Computed const&) = delete;

    [[nodiscard]] auto current() -> Value const&;
    auto subscribe(Listener listener) -> Subscription;
    // Stops tracking the state and drops every listener.
    auto destroy() -> void;

private:
    auto compute() -> bool;

    std::shared_ptr<ReactiveState>    state_;
    ReactiveState::Keys               keys_;
    Derive                            derive_;
    Value                             cached_;
    bool                              initialized_ = false;
    std::map<std::uint64_t, Listener> listeners_;
    std::uint64_t                     nextId_ = 1;
    std::shared_ptr<Computed*>        self_;
    Subscription                      stateSubscription_;
};

} // namespace MS
