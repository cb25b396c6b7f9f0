#include <mediastore/media/MediaElement.hpp>

#include <mediastore/log/TaggedLogger.hpp>

#include <algorithm>
#include <vector>

namespace MS {

MediaElement::MediaElement(EventLoop& loop, MediaTiming timing)
    : loop_(loop), timing_(timing), self_(std::make_shared<MediaElement*>(this)) {}

MediaElement::~MediaElement() {
    cancel(loadTimer_);
    cancel(seekTimer_);
    cancel(playTimer_);
}

auto MediaElement::setVolume(double volume) -> void {
    volume = std::clamp(volume, 0.0, 1.0);
    if (volume == volume_)
        return;
    volume_ = volume;
    dispatchEvent("volumechange");
}

auto MediaElement::setMuted(bool muted) -> void {
    if (muted == muted_)
        return;
    muted_ = muted;
    dispatchEvent("volumechange");
}

auto MediaElement::load(std::string source, double duration) -> void {
    cancel(loadTimer_);
    cancel(seekTimer_);
    cancel(playTimer_);
    ms_log("MediaElement load " + source, "Media");

    auto const hadSource = source_.has_value();
    source_              = std::move(source);
    pendingDuration_     = duration;
    readyState_          = ReadyState::HaveNothing;
    currentTime_         = 0.0;
    duration_            = 0.0;
    paused_              = true;
    ended_               = false;
    seeking_             = false;
    if (hadSource)
        dispatchEvent("emptied");
    dispatchEvent("loadstart");

    schedule(loadTimer_, timing_.load, [this] {
        duration_   = pendingDuration_;
        readyState_ = ReadyState::HaveMetadata;
        dispatchEvent("durationchange");
        dispatchEvent("loadedmetadata");
        readyState_ = ReadyState::HaveEnoughData;
        dispatchEvent("canplay");
    });
}

auto MediaElement::unload() -> void {
    if (!source_)
        return;
    cancel(loadTimer_);
    cancel(seekTimer_);
    cancel(playTimer_);
    source_.reset();
    readyState_  = ReadyState::HaveNothing;
    currentTime_ = 0.0;
    duration_    = 0.0;
    paused_      = true;
    ended_       = false;
    seeking_     = false;
    dispatchEvent("emptied");
}

auto MediaElement::play() -> bool {
    if (!source_)
        return false;
    if (ended_) {
        ended_       = false;
        currentTime_ = 0.0;
    }
    if (paused_) {
        paused_ = false;
        dispatchEvent("play");
    }
    armPlaying();
    return true;
}

auto MediaElement::armPlaying() -> void {
    schedule(playTimer_, timing_.play, [this] {
        if (paused_)
            return;
        // Still loading; check again after another play latency.
        if (readyState_ < ReadyState::HaveFutureData) {
            armPlaying();
            return;
        }
        dispatchEvent("playing");
    });
}

auto MediaElement::pause() -> void {
    cancel(playTimer_);
    if (paused_)
        return;
    paused_ = true;
    dispatchEvent("pause");
}

auto MediaElement::seek(double time) -> bool {
    if (!source_ || readyState_ < ReadyState::HaveMetadata)
        return false;
    currentTime_ = std::clamp(time, 0.0, duration_);
    ended_       = false;
    seeking_     = true;
    dispatchEvent("seeking");
    dispatchEvent("timeupdate");
    schedule(seekTimer_, timing_.seek, [this] {
        seeking_ = false;
        dispatchEvent("seeked");
    });
    return true;
}

auto MediaElement::tick(double seconds) -> void {
    if (paused_ || ended_ || readyState_ < ReadyState::HaveFutureData || seconds <= 0.0)
        return;
    currentTime_ = std::min(currentTime_ + seconds, duration_);
    dispatchEvent("timeupdate");
    if (currentTime_ >= duration_) {
        ended_  = true;
        paused_ = true;
        dispatchEvent("pause");
        dispatchEvent("ended");
    }
}

auto MediaElement::addEventListener(std::string type, Listener listener) -> Subscription {
    if (!listener)
        return Subscription{};
    auto const id = nextListenerId_++;
    listeners_.emplace(id, Registration{.type = std::move(type), .listener = std::move(listener)});
    return Subscription{[weak = std::weak_ptr<MediaElement*>(self_), id] {
        if (auto self = weak.lock())
            (*self)->listeners_.erase(id);
    }};
}

auto MediaElement::dispatchEvent(MediaEvent const& event) -> void {
    std::vector<std::uint64_t> ids;
    for (auto const& [id, registration] : listeners_) {
        if (registration.type == event.type)
            ids.push_back(id);
    }
    for (auto id : ids) {
        auto it = listeners_.find(id);
        if (it == listeners_.end())
            continue;
        auto listener = it->second.listener;
        listener(event);
    }
}

auto MediaElement::dispatchEvent(std::string type) -> void {
    dispatchEvent(MediaEvent{.type = std::move(type), .trusted = false, .timeStamp = loop_.now()});
}

auto MediaElement::listenerCount(std::string_view type) const -> std::size_t {
    return static_cast<std::size_t>(std::count_if(listeners_.begin(), listeners_.end(), [type](auto const& item) { return item.second.type == type; }));
}

auto MediaElement::schedule(std::optional<EventLoop::Id>& slot, std::chrono::milliseconds delay, std::function<void()> fn) -> void {
    cancel(slot);
    auto* target = &slot;
    slot         = loop_.setTimeout(
            [weak = std::weak_ptr<MediaElement*>(self_), target, fn = std::move(fn)] {
                if (weak.expired())
                    return;
                target->reset();
                fn();
            },
            delay);
}

auto MediaElement::cancel(std::optional<EventLoop::Id>& slot) -> void {
    if (slot) {
        loop_.clearTimeout(*slot);
        slot.reset();
    }
}

auto waitForEvent(MediaElement& element, std::string type, AbortSignal const& signal) -> Future<Value> {
    if (auto live = signal.check(); !live)
        return Future<Value>::Rejected(live.error());

    Promise<Value> promise;
    auto           handles = std::make_shared<std::pair<Subscription, Subscription>>();
    handles->first         = element.addEventListener(std::move(type), [promise, handles](MediaEvent const&) mutable {
        auto keep = handles;
        keep->first.unsubscribe();
        keep->second.unsubscribe();
        promise.resolve(true);
    });
    handles->second = signal.addListener([promise, handles](Error const& reason) mutable {
        auto keep = handles;
        keep->first.unsubscribe();
        keep->second.unsubscribe();
        promise.reject(reason);
    });
    return promise.future();
}

} // namespace MS
