#pragma once

#include <functional>
#include <utility>

namespace MS {

/**
 * Subscription: move-only handle to a registered listener.
 *
 * The registration is released when the handle is destroyed or when
 * unsubscribe() is called, whichever happens first. Releasing twice is a no-op.
 * The release callback must not throw.
 */
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> release)
        : release_(std::move(release)) {}

    Subscription(Subscription const&)            = delete;
    Subscription& operator=(Subscription const&) = delete;

    Subscription(Subscription&& other) noexcept
        : release_(std::exchange(other.release_, nullptr)) {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            unsubscribe();
            release_ = std::exchange(other.release_, nullptr);
        }
        return *this;
    }

    ~Subscription() {
        unsubscribe();
    }

    void unsubscribe() {
        if (auto release = std::exchange(release_, nullptr)) {
            release();
        }
    }

    // Drops the handle and leaves the registration in place for the owner to clean up.
    void detach() {
        release_ = nullptr;
    }

    [[nodiscard]] bool active() const {
        return static_cast<bool>(release_);
    }

private:
    std::function<void()> release_;
};

} // namespace MS
