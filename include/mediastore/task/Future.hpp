#pragma once
#include <mediastore/core/Error.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace MS {

template <typename T>
class Promise;

/**
 * Future: shared reader handle of a single-threaded, settle-once result.
 *
 * Continuations registered with then() run synchronously on the thread that
 * settles the paired Promise, in registration order. A continuation registered
 * after settlement runs immediately. Exceptions thrown by a continuation
 * propagate to whoever settled the promise.
 */
template <typename T>
class Future {
public:
    using Result       = Expected<T>;
    using Continuation = std::function<void(Result const&)>;

    Future() = default;

    static auto Resolved(T value) -> Future {
        Future future{std::make_shared<State>()};
        future.state_->result.emplace(std::move(value));
        return future;
    }

    static auto Rejected(Error error) -> Future {
        Future future{std::make_shared<State>()};
        future.state_->result.emplace(std::unexpected(std::move(error)));
        return future;
    }

    [[nodiscard]] auto valid() const -> bool { return static_cast<bool>(state_); }
    [[nodiscard]] auto ready() const -> bool { return state_ && state_->result.has_value(); }

    [[nodiscard]] auto result() const -> std::optional<Result> {
        if (!state_)
            return std::nullopt;
        return state_->result;
    }

    auto then(Continuation continuation) const -> void {
        if (!state_ || !continuation)
            return;
        if (state_->result) {
            continuation(*state_->result);
            return;
        }
        state_->continuations.push_back(std::move(continuation));
    }

    // Chains a transformation. fn receives the settled result and returns the next result.
    template <typename U>
    auto andThen(std::function<Expected<U>(Result const&)> fn) const -> Future<U>;

    friend auto operator==(Future const& lhs, Future const& rhs) -> bool { return lhs.state_ == rhs.state_; }

private:
    friend class Promise<T>;

    struct State {
        std::optional<Result>     result;
        std::vector<Continuation> continuations;
    };

    explicit Future(std::shared_ptr<State> state)
        : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

template <typename T>
class Promise {
public:
    Promise()
        : state_(std::make_shared<typename Future<T>::State>()) {}

    [[nodiscard]] auto future() const -> Future<T> { return Future<T>{state_}; }
    [[nodiscard]] auto settled() const -> bool { return state_->result.has_value(); }

    auto resolve(T value) -> bool { return settle(typename Future<T>::Result{std::move(value)}); }
    auto reject(Error error) -> bool { return settle(std::unexpected(std::move(error))); }

    // Returns false when the promise had already settled; the new result is dropped.
    auto settle(typename Future<T>::Result result) -> bool {
        if (state_->result)
            return false;
        state_->result.emplace(std::move(result));
        auto continuations = std::exchange(state_->continuations, {});
        for (auto& continuation : continuations)
            continuation(*state_->result);
        return true;
    }

private:
    std::shared_ptr<typename Future<T>::State> state_;
};

template <typename T>
template <typename U>
auto Future<T>::andThen(std::function<Expected<U>(Result const&)> fn) const -> Future<U> {
    Promise<U> next;
    auto       future = next.future();
    this->then([next, fn = std::move(fn)](Result const& result) mutable { next.settle(fn(result)); });
    return future;
}

} // namespace MS
