#pragma once
#include <mediastore/core/Error.hpp>
#include <mediastore/core/Subscription.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>

namespace MS {

/**
 * AbortSignal: cooperative cancellation token.
 *
 * A default constructed signal can never abort. Copies share state with the
 * controller that produced them. Listeners run once, in registration order,
 * when the owning controller aborts; a listener added to an already aborted
 * signal runs immediately and yields an inactive Subscription.
 */
class AbortSignal {
public:
    using Listener = std::function<void(Error const&)>;

    AbortSignal() = default;

    [[nodiscard]] auto aborted() const -> bool;
    [[nodiscard]] auto reason() const -> std::optional<Error>;

    // Returns the abort reason as an error, or success while the signal is live.
    [[nodiscard]] auto check() const -> Expected<void>;

    auto addListener(Listener listener) const -> Subscription;
    [[nodiscard]] auto listenerCount() const -> std::size_t;

    friend auto operator==(AbortSignal const& lhs, AbortSignal const& rhs) -> bool { return lhs.state_ == rhs.state_; }

private:
    friend class AbortController;

    struct State {
        bool                              aborted = false;
        std::optional<Error>              reason;
        std::map<std::uint64_t, Listener> listeners;
        std::uint64_t                     nextId = 1;
    };

    explicit AbortSignal(std::shared_ptr<State> state)
        : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class AbortController {
public:
    AbortController();

    [[nodiscard]] auto signal() const -> AbortSignal { return signal_; }
    [[nodiscard]] auto aborted() const -> bool { return signal_.aborted(); }

    // Fires the signal. Returns false if it had already fired.
    auto abort(Error reason = Error{Error::Code::Aborted, "aborted"}) -> bool;

    // Aborts this controller with the parent's reason when the parent aborts.
    auto follow(AbortSignal const& parent) -> Subscription;

private:
    explicit AbortController(AbortSignal signal)
        : signal_(std::move(signal)) {}

    AbortSignal signal_;
};

// Keeps subscription alive until signal aborts, then releases it.
auto releaseOnAbort(AbortSignal const& signal, Subscription subscription) -> void;

} // namespace MS
