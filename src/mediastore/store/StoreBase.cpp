#include <mediastore/store/StoreBase.hpp>

#include <exception>
#include <source_location>
#include <utility>

namespace MS {

auto errorSourceToString(ErrorSource source) -> std::string_view {
    switch (source) {
    case ErrorSource::Setup:
        return "setup";
    case ErrorSource::Attach:
        return "attach";
    case ErrorSource::Subscribe:
        return "subscribe";
    case ErrorSource::Snapshot:
        return "snapshot";
    case ErrorSource::Request:
        return "request";
    }
    return "unknown";
}

StoreBase::StoreBase(EventLoop& loop, Record initialState, StoreOptions options)
    : loop_(loop), initialState_(ReactiveState::DeepCopy(initialState)), onError_(std::move(options.onError)), logger_(std::move(options.logger)) {
    if (!logger_)
        logger_ = defaultErrorSink();
    // The live state never shares nested containers with the defaults or with other stores.
    state_ = options.state ? options.state(loop_, ReactiveState::DeepCopy(initialState_)) : nullptr;
    if (!state_)
        state_ = ReactiveState::Create(loop_, ReactiveState::DeepCopy(initialState_));
    queue_ = options.queue ? options.queue(loop_) : nullptr;
    if (!queue_)
        queue_ = std::make_unique<Queue>(loop_, QueueOptions{.logger = logger_});
}

StoreBase::~StoreBase() = default;

auto StoreBase::subscribe(ReactiveState::Listener listener) -> Subscription {
    return state_->subscribe(std::move(listener));
}

auto StoreBase::subscribe(ReactiveState::Keys keys, ReactiveState::Listener listener) -> Subscription {
    return state_->subscribe(std::move(keys), std::move(listener));
}

auto StoreBase::flush() -> void {
    state_->flush();
}

auto StoreBase::computed(ReactiveState::Keys keys, Computed::Derive derive) -> std::unique_ptr<Computed> {
    return std::make_unique<Computed>(state_, std::move(keys), std::move(derive));
}

auto StoreBase::reportError(ErrorContext const& context) -> void {
    if (onError_) {
        try {
            onError_(context);
            return;
        } catch (std::exception const& e) {
            logger_->log(std::string{"onError hook failed: "} + e.what(), {"Store", "Error"}, std::source_location::current());
        }
    }
    if (isCancellation(context.error)) {
        ms_log("Store " + std::string{errorSourceToString(context.source)} + " " + context.origin + " cancelled", "Store");
        return;
    }
    std::string message{"["};
    message.append(errorSourceToString(context.source));
    if (!context.origin.empty()) {
        message.push_back(':');
        message.append(context.origin);
    }
    message.append("] ");
    message.append(describeError(context.error));
    logger_->log(message, {"Store", "Error"}, std::source_location::current());
}

auto StoreBase::beginAttach() -> Expected<AttachScope> {
    if (destroyed_)
        return std::unexpected(Error{Error::Code::Destroyed, "store destroyed"});
    if (attachController_)
        attachController_->abort(Error{Error::Code::Aborted, "re-attached"});
    attachController_.emplace();
    attached_ = true;
    return AttachScope{.signal = attachController_->signal(), .generation = ++generation_};
}

auto StoreBase::endAttach() -> void {
    if (!attached_)
        return;
    attached_ = false;
    ++generation_;
    if (attachController_) {
        attachController_->abort(Error{Error::Code::Aborted, "detached"});
        attachController_.reset();
    }
    queue_->abort();
    state_->restore(initialState_);
}

auto StoreBase::markDestroyed() -> bool {
    if (destroyed_)
        return false;
    destroyed_ = true;
    return true;
}

auto StoreBase::finishDestroy() -> void {
    setupController_.abort(Error{Error::Code::Destroyed, "store destroyed"});
    queue_->destroy();
}

auto StoreBase::dispatch(RequestPlan plan, QueueTask::Handler handler) -> Future<Value> {
    if (plan.cancel.all) {
        queue_->abort();
    } else {
        for (auto const& key : plan.cancel.keys)
            queue_->abort(key);
    }

    auto name   = plan.name;
    auto future = queue_->enqueue(QueueTask{.name     = std::move(plan.name),
                                            .key      = std::move(plan.key),
                                            .mode     = plan.mode,
                                            .input    = std::move(plan.input),
                                            .meta     = std::move(plan.meta),
                                            .schedule = std::move(plan.schedule),
                                            .handler  = std::move(handler)});
    future.then([this, alive = lifetime(), name](Expected<Value> const& result) {
        if (result || alive.expired())
            return;
        reportError(ErrorContext{.source = ErrorSource::Request, .origin = name, .error = result.error()});
    });
    return future;
}

auto StoreBase::rejectRequest(std::string_view name, Error error) -> Future<Value> {
    reportError(ErrorContext{.source = ErrorSource::Request, .origin = std::string{name}, .error = error});
    return Future<Value>::Rejected(std::move(error));
}

} // namespace MS
