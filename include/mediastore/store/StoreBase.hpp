#pragma once
#include <mediastore/core/Error.hpp>
#include <mediastore/core/Subscription.hpp>
#include <mediastore/core/Value.hpp>
#include <mediastore/log/TaggedLogger.hpp>
#include <mediastore/runtime/EventLoop.hpp>
#include <mediastore/state/Computed.hpp>
#include <mediastore/state/ReactiveState.hpp>
#include <mediastore/store/Request.hpp>
#include <mediastore/task/AbortSignal.hpp>
#include <mediastore/task/Future.hpp>
#include <mediastore/task/Queue.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace MS {

enum class ErrorSource {
    Setup,
    Attach,
    Subscribe,
    Snapshot,
    Request
};

[[nodiscard]] auto errorSourceToString(ErrorSource source) -> std::string_view;

struct ErrorContext {
    ErrorSource source;
    std::string origin; // feature or request name; empty for store hooks
    Error       error;
};

using QueueFactory = std::function<std::unique_ptr<Queue>(EventLoop&)>;
using StateFactory = std::function<std::shared_ptr<ReactiveState>(EventLoop&, Record)>;

// Target independent part of a store configuration.
struct StoreOptions {
    std::function<void(ErrorContext const&)> onError;
    QueueFactory                             queue;
    StateFactory                             state;
    std::shared_ptr<LogSink>                 logger;
};

/**
 * StoreBase: lifecycle, state, queue and error routing shared by every Store<Target>.
 *
 * Owns the ReactiveState and the Queue. Tracks the attach generation so that
 * callbacks registered for one attach are ignored after detach or re-attach.
 * Errors go to onError when configured, otherwise to the injected logger.
 */
class StoreBase {
public:
    virtual ~StoreBase();

    StoreBase(StoreBase const&)            = delete;
    StoreBase& operator=(StoreBase const&) = delete;

    [[nodiscard]] auto destroyed() const -> bool { return destroyed_; }
    [[nodiscard]] auto attached() const -> bool { return attached_; }
    [[nodiscard]] auto loop() const -> EventLoop& { return loop_; }

    [[nodiscard]] auto state() const -> ReactiveState const& { return *state_; }
    [[nodiscard]] auto get(std::string_view key) const -> Value { return state_->get(key); }
    [[nodiscard]] auto snapshot() const -> Record { return state_->snapshot(); }
    [[nodiscard]] auto initialState() const -> Record const& { return initialState_; }

    [[nodiscard]] auto queue() -> Queue& { return *queue_; }
    [[nodiscard]] auto queue() const -> Queue const& { return *queue_; }

    auto subscribe(ReactiveState::Listener listener) -> Subscription;
    auto subscribe(ReactiveState::Keys keys, ReactiveState::Listener listener) -> Subscription;
    auto flush() -> void;

    // Derived value over this store's state.
    auto computed(ReactiveState::Keys keys, Computed::Derive derive) -> std::unique_ptr<Computed>;

    auto reportError(ErrorContext const& context) -> void;

protected:
    struct AttachScope {
        AbortSignal   signal;
        std::uint64_t generation = 0;
    };

    struct RequestPlan {
        std::string                name;
        std::string                key;
        TaskMode                   mode = TaskMode::Exclusive;
        Scheduler                  schedule;
        CancelPlan                 cancel;
        Value                      input;
        std::optional<RequestMeta> meta;
    };

    StoreBase(EventLoop& loop, Record initialState, StoreOptions options);

    auto mutableState() -> ReactiveState& { return *state_; }
    [[nodiscard]] auto setupSignal() const -> AbortSignal { return setupController_.signal(); }
    [[nodiscard]] auto isCurrentAttach(std::uint64_t generation) const -> bool { return attached_ && generation == generation_; }
    [[nodiscard]] auto lifetime() const -> std::weak_ptr<bool> { return alive_; }

    // Ends the previous attach and opens a new one. Fails once destroyed.
    auto beginAttach() -> Expected<AttachScope>;
    // Releases the attach signal, aborts every task and restores the initial state.
    auto endAttach() -> void;
    // Returns false when the store was already destroyed.
    auto markDestroyed() -> bool;
    auto finishDestroy() -> void;

    auto dispatch(RequestPlan plan, QueueTask::Handler handler) -> Future<Value>;
    auto rejectRequest(std::string_view name, Error error) -> Future<Value>;

private:
    EventLoop&                               loop_;
    Record                                   initialState_;
    std::function<void(ErrorContext const&)> onError_;
    std::shared_ptr<LogSink>                 logger_;
    std::shared_ptr<ReactiveState>           state_;
    std::unique_ptr<Queue>                   queue_;
    AbortController                          setupController_;
    std::optional<AbortController>           attachController_;
    std::uint64_t                            generation_ = 0;
    bool                                     attached_   = false;
    bool                                     destroyed_  = false;
    std::shared_ptr<bool>                    alive_      = std::make_shared<bool>(true);
};

} // namespace MS
