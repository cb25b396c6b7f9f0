#pragma once
#include <mediastore/core/Error.hpp>
#include <mediastore/runtime/EventLoop.hpp>
#include <mediastore/task/AbortSignal.hpp>
#include <mediastore/task/Future.hpp>
#include <mediastore/task/TaskInfo.hpp>

#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace MS {

template <typename Target>
struct GuardContext {
    Target&                    target;
    AbortSignal                signal;
    std::optional<RequestMeta> meta;
};

/**
 * GuardResult: a guard's verdict, decided now (bool) or later (Future<bool>).
 * A rejected future counts as a failed guard and keeps its error.
 */
class GuardResult {
public:
    GuardResult(bool passed)
        : result_(passed) {}
    GuardResult(Future<bool> pending)
        : result_(std::move(pending)) {}

    [[nodiscard]] auto pending() const -> bool { return std::holds_alternative<Future<bool>>(result_); }
    [[nodiscard]] auto passed() const -> bool {
        auto const* value = std::get_if<bool>(&result_);
        return value && *value;
    }
    [[nodiscard]] auto future() const -> Future<bool> {
        if (auto const* future = std::get_if<Future<bool>>(&result_))
            return *future;
        return Future<bool>::Resolved(passed());
    }

private:
    std::variant<bool, Future<bool>> result_;
};

template <typename Target>
using Guard = std::function<GuardResult(GuardContext<Target> const&)>;

namespace detail {

// Runs guards[index..] in order, stopping at the first failure.
template <typename Target>
auto evaluateGuards(std::shared_ptr<std::vector<Guard<Target>> const> guards, std::size_t index, GuardContext<Target> const& ctx) -> GuardResult {
    for (; index < guards->size(); ++index) {
        auto const& guard = (*guards)[index];
        if (!guard)
            continue;
        auto result = guard(ctx);
        if (!result.pending()) {
            if (!result.passed())
                return false;
            continue;
        }

        Promise<bool> promise;
        auto          future = promise.future();
        result.future().then([promise, guards, index, ctx](Expected<bool> const& outcome) mutable {
            if (!outcome) {
                promise.reject(outcome.error());
                return;
            }
            if (!*outcome) {
                promise.resolve(false);
                return;
            }
            try {
                evaluateGuards(guards, index + 1, ctx).future().then([promise](Expected<bool> const& rest) mutable { promise.settle(rest); });
            } catch (std::exception const& e) {
                promise.reject(Error{Error::Code::HandlerError, e.what()});
            } catch (...) {
                promise.reject(Error{Error::Code::HandlerError, "unknown exception"});
            }
        });
        return future;
    }
    return true;
}

} // namespace detail

namespace Guards {

// Passes when every guard passes. Guards run one after another.
template <typename Target>
auto all(std::vector<Guard<Target>> guards) -> Guard<Target> {
    std::shared_ptr<std::vector<Guard<Target>> const> shared = std::make_shared<std::vector<Guard<Target>>>(std::move(guards));
    return [shared](GuardContext<Target> const& ctx) -> GuardResult { return detail::evaluateGuards<Target>(shared, 0, ctx); };
}

// Passes when any guard passes. Synchronous verdicts are checked before waiting on pending ones.
template <typename Target>
auto any(std::vector<Guard<Target>> guards) -> Guard<Target> {
    return [guards = std::move(guards)](GuardContext<Target> const& ctx) -> GuardResult {
        std::vector<Future<bool>> pending;
        for (auto const& guard : guards) {
            if (!guard)
                continue;
            auto result = guard(ctx);
            if (result.pending())
                pending.push_back(result.future());
            else if (result.passed())
                return true;
        }
        if (pending.empty())
            return false;

        Promise<bool> promise;
        auto          remaining = std::make_shared<std::size_t>(pending.size());
        for (auto const& future : pending) {
            future.then([promise, remaining](Expected<bool> const& outcome) mutable {
                if (!outcome) {
                    promise.reject(outcome.error());
                    return;
                }
                if (*outcome) {
                    promise.resolve(true);
                    return;
                }
                if (--*remaining == 0)
                    promise.resolve(false);
            });
        }
        return promise.future();
    };
}

// Rejects with Timeout when a pending guard has not settled within limit.
// Aborting the request clears the timer.
template <typename Target>
auto timeout(EventLoop& loop, Guard<Target> guard, std::chrono::milliseconds limit, std::string name = "guard") -> Guard<Target> {
    return [&loop, guard = std::move(guard), limit, name = std::move(name)](GuardContext<Target> const& ctx) -> GuardResult {
        auto result = guard ? guard(ctx) : GuardResult{true};
        if (!result.pending())
            return result;

        Promise<bool> promise;
        auto const    timer = loop.setTimeout(
                [promise, name, limit]() mutable {
                    promise.reject(Error{Error::Code::Timeout, name + " timed out after " + std::to_string(limit.count()) + "ms"});
                },
                limit);
        auto release = std::make_shared<Subscription>(ctx.signal.addListener([&loop, timer](Error const&) { loop.clearTimeout(timer); }));
        result.future().then([promise, &loop, timer, release](Expected<bool> const& outcome) mutable {
            loop.clearTimeout(timer);
            release->unsubscribe();
            promise.settle(outcome);
        });
        return promise.future();
    };
}

} // namespace Guards

} // namespace MS
