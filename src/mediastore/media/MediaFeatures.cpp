#include <mediastore/media/MediaFeatures.hpp>

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <string>

namespace MS {

namespace {

using Context = RequestContext<MediaElement>;

// Re-reads the feature snapshot whenever one of events fires, until detach.
auto watch(FeatureSubscribeContext<MediaElement> const& ctx, std::initializer_list<char const*> events) -> void {
    for (auto const* event : events)
        ctx.own(ctx.target.addEventListener(event, [update = ctx.update](MediaEvent const&) { update(); }));
}

auto numberInput(Value const& input, std::string_view request) -> Expected<double> {
    auto number = input.as<double>();
    if (!number)
        return std::unexpected(Error{Error::Code::TypeMismatch, std::string{request} + ": " + number.error().message.value_or("")});
    if (!std::isfinite(*number))
        return std::unexpected(Error{Error::Code::TypeMismatch, std::string{request} + ": not a finite number"});
    return *number;
}

auto changeVolume(Value const& input, Context const& ctx) -> Expected<Value> {
    auto volume = numberInput(input, "changeVolume");
    if (!volume)
        return std::unexpected(volume.error());
    if (auto live = ctx.signal.check(); !live)
        return std::unexpected(live.error());
    auto const clamped = std::clamp(*volume, 0.0, 1.0);
    ctx.target.setVolume(clamped);
    if (clamped > 0.0)
        ctx.target.setMuted(false);
    return Value{clamped};
}

auto setMuted(Value const& input, Context const& ctx) -> Expected<Value> {
    auto muted = input.as<bool>();
    if (!muted)
        return std::unexpected(muted.error());
    if (auto live = ctx.signal.check(); !live)
        return std::unexpected(live.error());
    ctx.target.setMuted(*muted);
    // Unmuting silence restores an audible level.
    if (!*muted && ctx.target.volume() == 0.0)
        ctx.target.setVolume(0.25);
    return Value{*muted};
}

} // namespace

auto volumeLevel(double volume, bool muted) -> std::string_view {
    if (muted || volume == 0.0)
        return "off";
    if (volume < 0.5)
        return "low";
    if (volume < 0.75)
        return "medium";
    return "high";
}

auto hasSourceGuard() -> Guard<MediaElement> {
    return [](GuardContext<MediaElement> const& ctx) -> GuardResult {
        return ctx.target.source().has_value() && ctx.target.readyState() >= ReadyState::HaveMetadata;
    };
}

auto volumeFeature() -> MediaFeature {
    RequestMap<MediaElement> requests;
    requests.emplace("changeVolume", RequestConfig<MediaElement>{.key = "volume", .handler = changeVolume});
    requests.emplace("setVolume", RequestConfig<MediaElement>{.key = "volume", .handler = changeVolume});
    requests.emplace("setMuted", RequestConfig<MediaElement>{.key = "volume", .handler = setMuted});
    requests.emplace("toggleMute", RequestConfig<MediaElement>{.key = "volume", .handler = [](Value const&, Context const& ctx) -> Expected<Value> {
                                                                    return setMuted(Value{!ctx.target.muted()}, ctx);
                                                                }});

    return createFeature(FeatureConfig<MediaElement>{
            .name         = "volume",
            .initialState = {{"volume", 1.0}, {"muted", false}, {"volumeLevel", "high"}},
            .getSnapshot  = [](MediaElement& target) -> Record {
                return {{"volume", target.volume()},
                        {"muted", target.muted()},
                        {"volumeLevel", volumeLevel(target.volume(), target.muted())}};
            },
            .subscribe = [](FeatureSubscribeContext<MediaElement> const& ctx) { watch(ctx, {"volumechange"}); },
            .request   = std::move(requests)});
}

auto playbackFeature() -> MediaFeature {
    RequestMap<MediaElement> requests;
    requests.emplace("play", RequestConfig<MediaElement>{
                                     .key     = "playback",
                                     .mode    = TaskMode::Shared,
                                     .guard   = {hasSourceGuard()},
                                     .handler = [](Value const&, Context const& ctx) -> Future<Value> {
                                         if (!ctx.target.paused())
                                             return Future<Value>::Resolved(true);
                                         if (!ctx.target.source())
                                             return Future<Value>::Rejected(Error{Error::Code::Rejected, "play: nothing loaded"});
                                         auto playing = waitForEvent(ctx.target, "playing", ctx.signal);
                                         ctx.target.play();
                                         return playing;
                                     }});
    requests.emplace("pause", RequestConfig<MediaElement>{.key = "playback", .handler = [](Value const&, Context const& ctx) -> Expected<Value> {
                                                              if (auto live = ctx.signal.check(); !live)
                                                                  return std::unexpected(live.error());
                                                              ctx.target.pause();
                                                              return Value{true};
                                                          }});

    return createFeature(FeatureConfig<MediaElement>{
            .name         = "playback",
            .initialState = {{"paused", true}, {"ended", false}, {"playing", false}},
            .getSnapshot  = [](MediaElement& target) -> Record {
                return {{"paused", target.paused()}, {"ended", target.ended()}, {"playing", !target.paused() && !target.ended()}};
            },
            .subscribe = [](FeatureSubscribeContext<MediaElement> const& ctx) { watch(ctx, {"play", "pause", "playing", "ended", "emptied", "loadstart"}); },
            .request   = std::move(requests)});
}

auto timeFeature() -> MediaFeature {
    RequestMap<MediaElement> requests;
    requests.emplace("seek", RequestConfig<MediaElement>{
                                     .key     = "seek",
                                     .guard   = {hasSourceGuard()},
                                     .handler = [](Value const& input, Context const& ctx) -> Future<Value> {
                                         auto time = numberInput(input, "seek");
                                         if (!time)
                                             return Future<Value>::Rejected(time.error());
                                         if (!ctx.target.source() || ctx.target.readyState() < ReadyState::HaveMetadata)
                                             return Future<Value>::Rejected(Error{Error::Code::Rejected, "seek: nothing loaded"});
                                         auto seeked = waitForEvent(ctx.target, "seeked", ctx.signal);
                                         ctx.target.seek(*time);
                                         auto* target = &ctx.target;
                                         return seeked.andThen<Value>([target](Expected<Value> const& result) -> Expected<Value> {
                                             if (!result)
                                                 return std::unexpected(result.error());
                                             return Value{target->currentTime()};
                                         });
                                     }});

    return createFeature(FeatureConfig<MediaElement>{
            .name         = "time",
            .initialState = {{"currentTime", 0.0}, {"duration", 0.0}, {"seeking", false}},
            .getSnapshot  = [](MediaElement& target) -> Record {
                return {{"currentTime", target.currentTime()}, {"duration", target.duration()}, {"seeking", target.seeking()}};
            },
            .subscribe = [](FeatureSubscribeContext<MediaElement> const& ctx) {
                watch(ctx, {"timeupdate", "durationchange", "seeking", "seeked", "loadedmetadata", "emptied", "loadstart"});
            },
            .request = std::move(requests)});
}

auto sourceFeature() -> MediaFeature {
    RequestMap<MediaElement> requests;
    requests.emplace("loadSource", RequestConfig<MediaElement>{
                                           .key     = "source",
                                           .cancel  = cancelAll,
                                           .handler = [](Value const& input, Context const& ctx) -> Future<Value> {
                                               auto source = input.as<std::string>();
                                               if (!source)
                                                   return Future<Value>::Rejected(source.error());
                                               if (auto live = ctx.signal.check(); !live)
                                                   return Future<Value>::Rejected(live.error());
                                               auto ready = waitForEvent(ctx.target, "canplay", ctx.signal);
                                               ctx.target.load(*source);
                                               return ready.andThen<Value>([loaded = *source](Expected<Value> const& result) -> Expected<Value> {
                                                   if (!result)
                                                       return std::unexpected(result.error());
                                                   return Value{loaded};
                                               });
                                           }});

    return createFeature(FeatureConfig<MediaElement>{
            .name         = "source",
            .initialState = {{"source", nullptr}, {"readyState", 0}, {"canPlay", false}},
            .getSnapshot  = [](MediaElement& target) -> Record {
                auto const& source = target.source();
                return {{"source", source ? Value{*source} : Value{}},
                        {"readyState", static_cast<int>(target.readyState())},
                        {"canPlay", target.readyState() >= ReadyState::HaveFutureData}};
            },
            .subscribe = [](FeatureSubscribeContext<MediaElement> const& ctx) { watch(ctx, {"emptied", "loadstart", "loadedmetadata", "canplay"}); },
            .request   = std::move(requests)});
}

auto mediaFeatures() -> std::vector<MediaFeature> {
    return {sourceFeature(), volumeFeature(), playbackFeature(), timeFeature()};
}

auto mediaStoreConfig() -> StoreConfig<MediaElement> {
    StoreConfig<MediaElement> config;
    config.features = mediaFeatures();
    return config;
}

} // namespace MS
