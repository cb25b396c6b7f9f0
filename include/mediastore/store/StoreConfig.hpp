#pragma once
#include <mediastore/log/TaggedLogger.hpp>
#include <mediastore/store/Feature.hpp>
#include <mediastore/store/StoreBase.hpp>
#include <mediastore/task/AbortSignal.hpp>

#include <algorithm>
#include <functional>
#include <memory>
#include <set>
#include <utility>
#include <vector>

namespace MS {

template <typename Target>
class Store;

template <typename Target>
struct SetupContext {
    Store<Target>& store;
    AbortSignal    signal; // aborts when the store is destroyed
};

template <typename Target>
struct AttachContext {
    Store<Target>& store;
    Target&        target;
    AbortSignal    signal; // aborts on detach, re-attach and destroy
};

template <typename Target>
struct StoreConfig {
    std::vector<FeaturePtr<Target>>                   features;
    std::function<void(SetupContext<Target> const&)>  onSetup;
    std::function<void(AttachContext<Target> const&)> onAttach;
    std::function<void(ErrorContext const&)>          onError;
    QueueFactory                                      queue;
    StateFactory                                      state;
    std::shared_ptr<LogSink>                          logger;
};

namespace detail {

template <typename Context>
auto composeHooks(std::function<void(Context const&)> first, std::function<void(Context const&)> second) -> std::function<void(Context const&)> {
    if (!first)
        return second;
    if (!second)
        return first;
    return [first = std::move(first), second = std::move(second)](Context const& ctx) {
        first(ctx);
        second(ctx);
    };
}

} // namespace detail

/**
 * Merges two store configurations.
 *
 * Features are concatenated and de-duplicated by identity; a feature present in
 * both keeps the position of its later occurrence. Hooks compose so the base
 * hook runs before the extension's. Factories and the logger of the extension
 * replace the base's when set.
 */
template <typename Target>
auto extendConfig(StoreConfig<Target> base, StoreConfig<Target> extension) -> StoreConfig<Target> {
    StoreConfig<Target> merged;

    auto all = std::move(base.features);
    all.insert(all.end(), extension.features.begin(), extension.features.end());
    std::set<Feature<Target> const*> seen;
    for (auto it = all.rbegin(); it != all.rend(); ++it) {
        if (*it && seen.insert(it->get()).second)
            merged.features.push_back(*it);
    }
    std::reverse(merged.features.begin(), merged.features.end());

    merged.onSetup  = detail::composeHooks(std::move(base.onSetup), std::move(extension.onSetup));
    merged.onAttach = detail::composeHooks(std::move(base.onAttach), std::move(extension.onAttach));
    merged.onError  = detail::composeHooks(std::move(base.onError), std::move(extension.onError));
    merged.queue    = extension.queue ? std::move(extension.queue) : std::move(base.queue);
    merged.state    = extension.state ? std::move(extension.state) : std::move(base.state);
    merged.logger   = extension.logger ? std::move(extension.logger) : std::move(base.logger);
    return merged;
}

} // namespace MS
