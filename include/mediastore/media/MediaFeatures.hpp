#pragma once
#include <mediastore/media/MediaElement.hpp>
#include <mediastore/store/Feature.hpp>
#include <mediastore/store/Guard.hpp>
#include <mediastore/store/Store.hpp>
#include <mediastore/store/StoreConfig.hpp>

#include <string_view>
#include <vector>

namespace MS {

using MediaFeature = FeaturePtr<MediaElement>;
using MediaStore   = Store<MediaElement>;

// "off", "low", "medium" or "high" for the element's current volume.
[[nodiscard]] auto volumeLevel(double volume, bool muted) -> std::string_view;

// Passes when the element has at least loaded metadata.
[[nodiscard]] auto hasSourceGuard() -> Guard<MediaElement>;

/**
 * volume, muted, volumeLevel.
 * changeVolume / setVolume (key "volume"): clamps to [0, 1]; a non-zero volume unmutes.
 * toggleMute / setMuted share the "volume" key.
 */
[[nodiscard]] auto volumeFeature() -> MediaFeature;

/**
 * paused, ended, playing.
 * play (shared, key "playback"): resolves when the element fires "playing".
 * pause (key "playback"): supersedes pending plays.
 */
[[nodiscard]] auto playbackFeature() -> MediaFeature;

/**
 * currentTime, duration, seeking.
 * seek (key "seek", guarded by a loaded source): resolves with the new time once "seeked" fires.
 */
[[nodiscard]] auto timeFeature() -> MediaFeature;

/**
 * source, readyState, canPlay.
 * loadSource (key "source", cancels every live request): resolves once "canplay" fires.
 */
[[nodiscard]] auto sourceFeature() -> MediaFeature;

[[nodiscard]] auto mediaFeatures() -> std::vector<MediaFeature>;
[[nodiscard]] auto mediaStoreConfig() -> StoreConfig<MediaElement>;

} // namespace MS
