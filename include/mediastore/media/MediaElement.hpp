#pragma once
#include <mediastore/core/Subscription.hpp>
#include <mediastore/core/Value.hpp>
#include <mediastore/runtime/EventLoop.hpp>
#include <mediastore/task/AbortSignal.hpp>
#include <mediastore/task/Future.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace MS {

struct MediaEvent {
    std::string               type;
    bool                      trusted = false;
    std::chrono::milliseconds timeStamp{0};
};

enum class ReadyState {
    HaveNothing      = 0,
    HaveMetadata     = 1,
    HaveCurrentData  = 2,
    HaveFutureData   = 3,
    HaveEnoughData   = 4
};

// Latencies of the simulated element, in virtual loop time.
struct MediaTiming {
    std::chrono::milliseconds load{50};
    std::chrono::milliseconds seek{20};
    std::chrono::milliseconds play{10};
};

/**
 * MediaElement: a simulated playable element driven by an EventLoop.
 *
 * Mirrors the observable surface of an HTML media element: property setters
 * dispatch the matching events synchronously, and the slow operations (load,
 * seek, play) complete after their MediaTiming latency on the loop's virtual
 * clock. Superseded slow operations never dispatch their completion events.
 */
class MediaElement {
public:
    using Listener = std::function<void(MediaEvent const&)>;

    explicit MediaElement(EventLoop& loop, MediaTiming timing = {});
    ~MediaElement();

    MediaElement(MediaElement const&)            = delete;
    MediaElement& operator=(MediaElement const&) = delete;

    [[nodiscard]] auto volume() const -> double { return volume_; }
    [[nodiscard]] auto muted() const -> bool { return muted_; }
    [[nodiscard]] auto paused() const -> bool { return paused_; }
    [[nodiscard]] auto ended() const -> bool { return ended_; }
    [[nodiscard]] auto seeking() const -> bool { return seeking_; }
    [[nodiscard]] auto currentTime() const -> double { return currentTime_; }
    [[nodiscard]] auto duration() const -> double { return duration_; }
    [[nodiscard]] auto source() const -> std::optional<std::string> const& { return source_; }
    [[nodiscard]] auto readyState() const -> ReadyState { return readyState_; }

    // Values outside [0, 1] are clamped.
    auto setVolume(double volume) -> void;
    auto setMuted(bool muted) -> void;

    // Starts loading source; metadata arrives after the load latency.
    auto load(std::string source, double duration = 60.0) -> void;
    // Drops the source and returns to HaveNothing.
    auto unload() -> void;
    // Returns false when nothing is loaded. Fires "play" now and "playing" after the play latency.
    auto play() -> bool;
    auto pause() -> void;
    // Fires "seeking" now and "seeked" after the seek latency. Returns false when nothing is loaded.
    auto seek(double time) -> bool;
    // Moves the playhead while playing; fires "timeupdate" and "ended" at the end.
    auto tick(double seconds) -> void;

    auto addEventListener(std::string type, Listener listener) -> Subscription;
    auto dispatchEvent(MediaEvent const& event) -> void;
    auto dispatchEvent(std::string type) -> void;
    [[nodiscard]] auto listenerCount() const -> std::size_t { return listeners_.size(); }
    [[nodiscard]] auto listenerCount(std::string_view type) const -> std::size_t;

    [[nodiscard]] auto loop() const -> EventLoop& { return loop_; }

private:
    struct Registration {
        std::string type;
        Listener    listener;
    };

    auto schedule(std::optional<EventLoop::Id>& slot, std::chrono::milliseconds delay, std::function<void()> fn) -> void;
    auto cancel(std::optional<EventLoop::Id>& slot) -> void;
    auto armPlaying() -> void;

    EventLoop&                            loop_;
    MediaTiming                           timing_;
    double                                volume_      = 1.0;
    bool                                  muted_       = false;
    bool                                  paused_      = true;
    bool                                  ended_       = false;
    bool                                  seeking_     = false;
    double                                currentTime_ = 0.0;
    double                                duration_    = 0.0;
    double                                pendingDuration_ = 0.0;
    std::optional<std::string>            source_;
    ReadyState                            readyState_ = ReadyState::HaveNothing;
    std::map<std::uint64_t, Registration> listeners_;
    std::uint64_t                         nextListenerId_ = 1;
    std::optional<EventLoop::Id>          loadTimer_;
    std::optional<EventLoop::Id>          seekTimer_;
    std::optional<EventLoop::Id>          playTimer_;
    std::shared_ptr<MediaElement*>        self_;
};

// Resolves with true on the next event of type; rejects with the abort reason when signal aborts first.
auto waitForEvent(MediaElement& element, std::string type, AbortSignal const& signal) -> Future<Value>;

} // namespace MS
