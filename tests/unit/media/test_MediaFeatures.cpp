#include <mediastore/media/MediaFeatures.hpp>

#include <doctest/doctest.h>

#include <optional>
#include <string>
#include <vector>

using namespace MS;
using namespace std::chrono_literals;

namespace {

struct Capture {
    std::optional<Expected<Value>> result;

    auto sink() {
        return [this](Expected<Value> const& r) { result = r; };
    }
    [[nodiscard]] auto code() const -> Error::Code { return result->error().code; }
};

struct Fixture {
    EventLoop                 loop;
    MediaElement              element{loop};
    std::vector<ErrorContext> errors;
    MediaStore                store{loop, withErrors(mediaStoreConfig())};

    Fixture() {
        auto attached = store.attach(element);
        REQUIRE(attached.has_value());
    }

    auto withErrors(StoreConfig<MediaElement> config) -> StoreConfig<MediaElement> {
        config.onError = [this](ErrorContext const& context) { errors.push_back(context); };
        return config;
    }

    auto load(std::string const& source) -> Capture {
        Capture capture;
        store.request("loadSource", source).then(capture.sink());
        loop.runUntilIdle();
        loop.advance(50ms);
        return capture;
    }

    auto number(std::string_view key) const -> double { return store.get(key).valueOr(-1.0); }
};

} // namespace

TEST_SUITE("media.features") {
    TEST_CASE("Initial state covers every feature") {
        Fixture f;
        auto    state = f.store.snapshot();
        CHECK(state.at("source").isNull());
        CHECK(state.at("readyState") == Value{0});
        CHECK(state.at("canPlay") == Value{false});
        CHECK(state.at("volume") == Value{1.0});
        CHECK(state.at("volumeLevel") == Value{"high"});
        CHECK(state.at("paused") == Value{true});
        CHECK(state.at("playing") == Value{false});
        CHECK(state.at("currentTime") == Value{0.0});
        CHECK(state.at("seeking") == Value{false});
        CHECK(f.store.features().size() == 4);
    }

    TEST_CASE("volumeLevel buckets") {
        CHECK(volumeLevel(0.9, true) == "off");
        CHECK(volumeLevel(0.0, false) == "off");
        CHECK(volumeLevel(0.2, false) == "low");
        CHECK(volumeLevel(0.6, false) == "medium");
        CHECK(volumeLevel(0.75, false) == "high");
    }

    TEST_CASE("changeVolume clamps, unmutes and updates the level") {
        Fixture f;
        f.element.setMuted(true);

        Capture capture;
        f.store.request("changeVolume", 0.3).then(capture.sink());
        f.loop.runUntilIdle();
        REQUIRE(capture.result.has_value());
        CHECK(*capture.result->value().as<double>() == doctest::Approx(0.3));
        CHECK(f.number("volume") == doctest::Approx(0.3));
        CHECK(f.store.get("muted") == Value{false});
        CHECK(f.store.get("volumeLevel") == Value{"low"});

        f.store.request("setVolume", 4.0);
        f.loop.runUntilIdle();
        CHECK(f.element.volume() == 1.0);

        Capture invalid;
        f.store.request("changeVolume", "loud").then(invalid.sink());
        f.loop.runUntilIdle();
        CHECK(invalid.code() == Error::Code::TypeMismatch);
        CHECK(f.element.volume() == 1.0);
    }

    TEST_CASE("Mute requests") {
        Fixture f;
        f.store.request("toggleMute");
        f.loop.runUntilIdle();
        CHECK(f.store.get("muted") == Value{true});
        CHECK(f.store.get("volumeLevel") == Value{"off"});

        f.store.request("changeVolume", 0.0);
        f.loop.runUntilIdle();
        f.store.request("setMuted", false);
        f.loop.runUntilIdle();
        CHECK(f.store.get("muted") == Value{false});
        CHECK(f.number("volume") == doctest::Approx(0.25));
    }

    TEST_CASE("loadSource resolves once the element can play") {
        Fixture f;
        auto    loaded = f.load("movie.mp4");
        REQUIRE(loaded.result.has_value());
        CHECK(loaded.result->value() == Value{"movie.mp4"});
        CHECK(f.store.get("source") == Value{"movie.mp4"});
        CHECK(f.store.get("readyState") == Value{4});
        CHECK(f.store.get("canPlay") == Value{true});
        CHECK(f.number("duration") == doctest::Approx(60.0));
        CHECK(f.store.queue().task("loadSource")->status == TaskStatus::Success);
    }

    TEST_CASE("Playback is guarded by a loaded source") {
        Fixture f;
        Capture rejected;
        f.store.request("play").then(rejected.sink());
        f.loop.runUntilIdle();
        CHECK(rejected.code() == Error::Code::Rejected);

        f.load("movie.mp4");
        Capture playing;
        f.store.request("play").then(playing.sink());
        f.loop.runUntilIdle();
        CHECK(f.store.get("paused") == Value{false});
        CHECK_FALSE(playing.result.has_value());
        f.loop.advance(10ms);
        REQUIRE(playing.result.has_value());
        CHECK(playing.result->has_value());
        CHECK(f.store.get("playing") == Value{true});

        f.store.request("pause");
        f.loop.runUntilIdle();
        CHECK(f.store.get("paused") == Value{true});
        CHECK(f.store.get("playing") == Value{false});
    }

    TEST_CASE("Pause supersedes a queued play") {
        Fixture f;
        f.load("movie.mp4");
        Capture play;
        f.store.request("play").then(play.sink());
        f.store.request("pause");
        f.loop.runUntilIdle();
        f.loop.advance(20ms);
        REQUIRE(play.result.has_value());
        CHECK(play.code() == Error::Code::Superseded);
        CHECK(f.element.paused());
    }

    TEST_CASE("Seek resolves with the new time") {
        Fixture f;
        f.load("movie.mp4");
        Capture seek;
        f.store.request("seek", 12.5).then(seek.sink());
        f.loop.runUntilIdle();
        CHECK(f.store.get("seeking") == Value{true});
        f.loop.advance(20ms);
        REQUIRE(seek.result.has_value());
        CHECK(*seek.result->value().as<double>() == doctest::Approx(12.5));
        CHECK(f.number("currentTime") == doctest::Approx(12.5));
        CHECK(f.store.get("seeking") == Value{false});
    }

    TEST_CASE("Loading a new source cancels every live request") {
        Fixture f;
        f.load("first.mp4");
        Capture seek;
        f.store.request("seek", 5.0).then(seek.sink());
        f.loop.runUntilIdle();

        auto second = f.load("second.mp4");
        REQUIRE(seek.result.has_value());
        CHECK(isCancellation(seek.result->error()));
        CHECK(second.result->value() == Value{"second.mp4"});
        CHECK(f.number("currentTime") == doctest::Approx(0.0));
        CHECK(f.element.listenerCount("seeked") == 0);
    }

    TEST_CASE("Detach restores initial state and drops element listeners") {
        Fixture f;
        f.load("movie.mp4");
        CHECK(f.element.listenerCount() > 0);
        f.store.detach();
        CHECK(f.element.listenerCount() == 0);
        CHECK(f.store.get("source").isNull());
        f.element.setVolume(0.1);
        f.loop.runUntilIdle();
        CHECK(f.store.get("volume") == Value{1.0});
    }
}
