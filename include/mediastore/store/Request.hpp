#pragma once
#include <mediastore/core/Error.hpp>
#include <mediastore/core/Value.hpp>
#include <mediastore/store/Guard.hpp>
#include <mediastore/task/AbortSignal.hpp>
#include <mediastore/task/Future.hpp>
#include <mediastore/task/Scheduler.hpp>
#include <mediastore/task/TaskInfo.hpp>

#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace MS {

template <typename Target>
struct RequestContext {
    Target&                    target;
    AbortSignal                signal;
    std::optional<RequestMeta> meta;
};

/**
 * RequestHandler: the body of a request, normalized to return Future<Value>.
 *
 * Accepts callables of (Value const& input, RequestContext<Target> const&)
 * returning Future<Value>, Expected<Value>, void, or anything convertible to
 * Value.
 */
template <typename Target>
class RequestHandler {
public:
    using Context  = RequestContext<Target>;
    using Function = std::function<Future<Value>(Value const&, Context const&)>;

    RequestHandler() = default;

    template <typename Fn>
        requires(std::invocable<Fn&, Value const&, Context const&> && !std::same_as<std::decay_t<Fn>, RequestHandler>)
    RequestHandler(Fn fn)
        : fn_(normalize(std::move(fn))) {}

    explicit operator bool() const { return static_cast<bool>(fn_); }

    auto operator()(Value const& input, Context const& ctx) const -> Future<Value> {
        if (!fn_)
            return Future<Value>::Resolved(Value{});
        return fn_(input, ctx);
    }

private:
    template <typename Fn>
    static auto normalize(Fn fn) -> Function {
        using Result = std::invoke_result_t<Fn&, Value const&, Context const&>;
        return [fn = std::move(fn)](Value const& input, Context const& ctx) mutable -> Future<Value> {
            if constexpr (std::same_as<Result, Future<Value>>) {
                return fn(input, ctx);
            } else if constexpr (std::same_as<Result, Expected<Value>>) {
                auto result = fn(input, ctx);
                if (!result)
                    return Future<Value>::Rejected(std::move(result.error()));
                return Future<Value>::Resolved(std::move(*result));
            } else if constexpr (std::is_void_v<Result>) {
                fn(input, ctx);
                return Future<Value>::Resolved(Value{});
            } else {
                static_assert(std::is_convertible_v<Result, Value>, "request handlers must return Future<Value>, Expected<Value>, void or a Value");
                return Future<Value>::Resolved(Value{fn(input, ctx)});
            }
        };
    }

    Function fn_;
};

// Literal key, or a key computed from the request input. An empty literal means the request name.
using RequestKey = std::variant<std::string, std::function<std::string(Value const&)>>;

struct CancelAll {};
inline constexpr CancelAll cancelAll{};

// Keys to abort before the request is queued.
using RequestCancel = std::variant<std::monostate, CancelAll, std::vector<std::string>, std::function<std::vector<std::string>(Value const&)>>;

struct CancelPlan {
    bool                     all = false;
    std::vector<std::string> keys;
};

template <typename Target>
struct RequestConfig {
    RequestKey                 key;
    TaskMode                   mode = TaskMode::Exclusive;
    Scheduler                  schedule;
    std::vector<Guard<Target>> guard;
    RequestCancel              cancel;
    RequestHandler<Target>     handler;
};

// Key functions may throw; callers convert the exception into a request error.
[[nodiscard]] auto resolveRequestKey(RequestKey const& key, std::string_view name, Value const& input) -> std::string;
[[nodiscard]] auto resolveRequestCancel(RequestCancel const& cancel, Value const& input) -> CancelPlan;

} // namespace MS
