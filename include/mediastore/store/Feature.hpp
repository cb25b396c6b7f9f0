#pragma once
#include <mediastore/core/Subscription.hpp>
#include <mediastore/core/Value.hpp>
#include <mediastore/store/Request.hpp>
#include <mediastore/task/AbortSignal.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace MS {

namespace detail {
auto generateFeatureName() -> std::string;
} // namespace detail

/**
 * Everything a feature needs while attached. Registrations made in subscribe
 * must be released when signal aborts; own() does that for a Subscription.
 */
template <typename Target>
struct FeatureSubscribeContext {
    Target&               target;
    std::function<void()> update; // re-reads this feature's snapshot into the store state
    AbortSignal           signal;

    auto own(Subscription subscription) const -> void { releaseOnAbort(signal, std::move(subscription)); }
};

template <typename Target>
using RequestMap = std::map<std::string, RequestConfig<Target>, std::less<>>;

template <typename Target>
struct FeatureConfig {
    std::string                                                 name; // empty: a generated "feature-N"
    Record                                                      initialState;
    std::function<Record(Target&)>                              getSnapshot;
    std::function<void(FeatureSubscribeContext<Target> const&)> subscribe;
    RequestMap<Target>                                          request;
};

/**
 * Feature: immutable unit of state and behaviour over a Target.
 *
 * Features carry no per-store state and may be shared by any number of stores.
 * Stores and extendConfig compare features by identity (the shared pointer).
 */
template <typename Target>
class Feature {
public:
    explicit Feature(FeatureConfig<Target> config)
        : config_(std::move(config)) {
        if (config_.name.empty())
            config_.name = detail::generateFeatureName();
    }

    [[nodiscard]] auto name() const -> std::string const& { return config_.name; }
    [[nodiscard]] auto initialState() const -> Record const& { return config_.initialState; }
    [[nodiscard]] auto requests() const -> RequestMap<Target> const& { return config_.request; }

    [[nodiscard]] auto snapshot(Target& target) const -> Record {
        if (!config_.getSnapshot)
            return {};
        return config_.getSnapshot(target);
    }

    auto subscribe(FeatureSubscribeContext<Target> const& ctx) const -> void {
        if (config_.subscribe)
            config_.subscribe(ctx);
    }

private:
    FeatureConfig<Target> config_;
};

template <typename Target>
using FeaturePtr = std::shared_ptr<Feature<Target> const>;

template <typename Target>
auto createFeature(FeatureConfig<Target> config) -> FeaturePtr<Target> {
    return std::make_shared<Feature<Target>>(std::move(config));
}

} // namespace MS
