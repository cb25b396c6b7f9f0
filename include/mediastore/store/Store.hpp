#pragma once
#include <mediastore/core/Error.hpp>
#include <mediastore/core/Value.hpp>
#include <mediastore/store/Feature.hpp>
#include <mediastore/store/Guard.hpp>
#include <mediastore/store/Request.hpp>
#include <mediastore/store/StoreBase.hpp>
#include <mediastore/store/StoreConfig.hpp>

#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace MS {

/**
 * Store: composes features over one Target type.
 *
 * Lifecycle: construction runs onSetup once; attach()/detach() may then cycle
 * any number of times; destroy() is terminal and idempotent.
 *
 * attach(target):
 *   1. ends the previous attach (its signal aborts, its subscriptions go away)
 *   2. resets state to the union of the features' initial state
 *   3. calls every feature's subscribe; a throwing feature is reported and the
 *      others still subscribe
 *   4. merges every feature's snapshot into state
 *   5. calls onAttach
 * Steps 2-4 run inside one state batch, so observers see a single round.
 *
 * request(name, input) resolves the request's key and cancel list, aborts the
 * cancelled keys and queues the request. When the task runs it reads the
 * current target, evaluates the guards in order and calls the handler. The
 * returned future rejects on every failure, and every failure is also routed
 * to onError (or the logger).
 */
template <typename Target>
class Store : public StoreBase {
public:
    using Config   = StoreConfig<Target>;
    using Detacher = std::function<void()>;

    Store(EventLoop& loop, Config config);
    ~Store() override { destroy(); }

    // The returned detacher only detaches the attach that produced it.
    auto attach(Target& target) -> Expected<Detacher>;
    auto detach() -> void;
    auto destroy() -> void;

    auto request(std::string_view name, Value input = {}, std::optional<RequestMeta> meta = std::nullopt) -> Future<Value>;

    [[nodiscard]] auto target() const -> Target* { return target_; }
    [[nodiscard]] auto features() const -> std::vector<FeaturePtr<Target>> const& { return config_.features; }
    [[nodiscard]] auto hasRequest(std::string_view name) const -> bool { return requests_.find(name) != requests_.end(); }
    [[nodiscard]] auto requestNames() const -> std::vector<std::string>;

private:
    using RequestPtr = std::shared_ptr<RequestConfig<Target> const>;

    static auto mergeInitialState(std::vector<FeaturePtr<Target>> const& features) -> Record;
    static auto toOptions(Config const& config) -> StoreOptions;

    auto applySnapshot(Feature<Target> const& feature) -> void;
    auto run(std::string const& name, RequestPtr const& config, TaskContext const& ctx) -> Future<Value>;
    auto invoke(std::string const& name, RequestPtr const& config, TaskContext const& ctx) -> Future<Value>;

    Config                                          config_;
    std::map<std::string, RequestPtr, std::less<>> requests_;
    Target*                                         target_ = nullptr;
};

template <typename Target>
Store<Target>::Store(EventLoop& loop, Config config)
    : StoreBase(loop, mergeInitialState(config.features), toOptions(config)), config_(std::move(config)) {
    for (auto const& feature : config_.features) {
        if (!feature)
            continue;
        for (auto const& [name, request] : feature->requests())
            requests_.insert_or_assign(name, std::make_shared<RequestConfig<Target>>(request));
    }

    if (config_.onSetup) {
        try {
            config_.onSetup(SetupContext<Target>{.store = *this, .signal = setupSignal()});
        } catch (std::exception const& e) {
            reportError(ErrorContext{.source = ErrorSource::Setup, .origin = {}, .error = Error{Error::Code::UnknownError, e.what()}});
        }
    }
}

template <typename Target>
auto Store<Target>::mergeInitialState(std::vector<FeaturePtr<Target>> const& features) -> Record {
    Record merged;
    for (auto const& feature : features) {
        if (!feature)
            continue;
        for (auto const& [key, value] : feature->initialState())
            merged.insert_or_assign(key, value);
    }
    return merged;
}

template <typename Target>
auto Store<Target>::toOptions(Config const& config) -> StoreOptions {
    return StoreOptions{.onError = config.onError, .queue = config.queue, .state = config.state, .logger = config.logger};
}

template <typename Target>
auto Store<Target>::attach(Target& target) -> Expected<Detacher> {
    auto scope = beginAttach();
    if (!scope)
        return std::unexpected(scope.error());

    target_                = &target;
    auto const generation  = scope->generation;
    auto const signal      = scope->signal;
    ms_log("Store attach generation " + std::to_string(generation), "Store");

    mutableState().batch([&] {
        mutableState().restore(initialState());
        for (auto const& feature : config_.features) {
            if (!feature)
                continue;
            auto update = [this, alive = lifetime(), generation, weak = std::weak_ptr<Feature<Target> const>(feature)] {
                auto current = weak.lock();
                if (alive.expired() || !current || !isCurrentAttach(generation) || !target_)
                    return;
                applySnapshot(*current);
            };
            try {
                feature->subscribe(FeatureSubscribeContext<Target>{.target = target, .update = std::move(update), .signal = signal});
            } catch (std::exception const& e) {
                reportError(ErrorContext{.source = ErrorSource::Subscribe, .origin = feature->name(), .error = Error{Error::Code::UnknownError, e.what()}});
            }
        }
        for (auto const& feature : config_.features) {
            if (feature && isCurrentAttach(generation))
                applySnapshot(*feature);
        }
    });

    if (config_.onAttach && isCurrentAttach(generation)) {
        try {
            config_.onAttach(AttachContext<Target>{.store = *this, .target = target, .signal = signal});
        } catch (std::exception const& e) {
            reportError(ErrorContext{.source = ErrorSource::Attach, .origin = {}, .error = Error{Error::Code::UnknownError, e.what()}});
        }
    }

    return Detacher{[this, alive = lifetime(), generation] {
        if (alive.expired() || !isCurrentAttach(generation))
            return;
        detach();
    }};
}

template <typename Target>
auto Store<Target>::detach() -> void {
    if (!target_)
        return;
    ms_log("Store detach", "Store");
    target_ = nullptr;
    endAttach();
}

template <typename Target>
auto Store<Target>::destroy() -> void {
    if (!markDestroyed())
        return;
    ms_log("Store destroy", "Store");
    detach();
    finishDestroy();
}

template <typename Target>
auto Store<Target>::request(std::string_view name, Value input, std::optional<RequestMeta> meta) -> Future<Value> {
    if (destroyed())
        return rejectRequest(name, Error{Error::Code::Destroyed, "store destroyed"});

    auto it = requests_.find(name);
    if (it == requests_.end())
        return rejectRequest(name, Error{Error::Code::NoSuchRequest, "no request named " + std::string{name}});
    if (!target_)
        return rejectRequest(name, Error{Error::Code::NoTarget, "no target attached"});

    auto const& config = it->second;
    RequestPlan plan{.name = std::string{name}, .mode = config->mode, .schedule = config->schedule, .input = std::move(input), .meta = std::move(meta)};
    try {
        plan.key    = resolveRequestKey(config->key, name, plan.input);
        plan.cancel = resolveRequestCancel(config->cancel, plan.input);
    } catch (std::exception const& e) {
        return rejectRequest(name, Error{Error::Code::HandlerError, e.what()});
    } catch (...) {
        return rejectRequest(name, Error{Error::Code::HandlerError, "unknown exception"});
    }

    return dispatch(std::move(plan), [this, alive = lifetime(), requestName = std::string{name}, config](TaskContext const& ctx) -> Future<Value> {
        if (alive.expired())
            return Future<Value>::Rejected(Error{Error::Code::Destroyed, "store destroyed"});
        return run(requestName, config, ctx);
    });
}

template <typename Target>
auto Store<Target>::run(std::string const& name, RequestPtr const& config, TaskContext const& ctx) -> Future<Value> {
    if (!target_)
        return Future<Value>::Rejected(Error{Error::Code::NoTarget, "no target attached"});

    std::shared_ptr<std::vector<Guard<Target>> const> guards = std::make_shared<std::vector<Guard<Target>>>(config->guard);
    auto verdict = detail::evaluateGuards<Target>(guards, 0, GuardContext<Target>{.target = *target_, .signal = ctx.signal, .meta = ctx.meta});
    if (!verdict.pending()) {
        if (!verdict.passed())
            return Future<Value>::Rejected(Error{Error::Code::Rejected, "guard rejected " + name});
        return invoke(name, config, ctx);
    }

    Promise<Value> promise;
    verdict.future().then([this, alive = lifetime(), promise, name, config, ctx](Expected<bool> const& passed) mutable {
        if (!passed) {
            promise.reject(passed.error());
            return;
        }
        if (!*passed) {
            promise.reject(Error{Error::Code::Rejected, "guard rejected " + name});
            return;
        }
        if (alive.expired()) {
            promise.reject(Error{Error::Code::Destroyed, "store destroyed"});
            return;
        }
        try {
            invoke(name, config, ctx).then([promise](Expected<Value> const& result) mutable { promise.settle(result); });
        } catch (std::exception const& e) {
            promise.reject(Error{Error::Code::HandlerError, e.what()});
        } catch (...) {
            promise.reject(Error{Error::Code::HandlerError, "unknown exception"});
        }
    });
    return promise.future();
}

template <typename Target>
auto Store<Target>::invoke(std::string const& name, RequestPtr const& config, TaskContext const& ctx) -> Future<Value> {
    if (auto live = ctx.signal.check(); !live)
        return Future<Value>::Rejected(live.error());
    if (!target_)
        return Future<Value>::Rejected(Error{Error::Code::NoTarget, "no target attached"});
    ms_log("Store request " + name, "Store");
    return config->handler(ctx.input, RequestContext<Target>{.target = *target_, .signal = ctx.signal, .meta = ctx.meta});
}

template <typename Target>
auto Store<Target>::applySnapshot(Feature<Target> const& feature) -> void {
    if (!target_)
        return;
    try {
        mutableState().patch(feature.snapshot(*target_));
    } catch (std::exception const& e) {
        reportError(ErrorContext{.source = ErrorSource::Snapshot, .origin = feature.name(), .error = Error{Error::Code::UnknownError, e.what()}});
    }
}

template <typename Target>
auto Store<Target>::requestNames() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(requests_.size());
    for (auto const& [name, config] : requests_)
        names.push_back(name);
    return names;
}

} // namespace MS
