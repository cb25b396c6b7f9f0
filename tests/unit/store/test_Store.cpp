#include <mediastore/media/MediaFeatures.hpp>
#include <mediastore/store/Store.hpp>

#include <doctest/doctest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace MS;
using namespace std::chrono_literals;

namespace {

using Ctx = RequestContext<MediaElement>;

struct Capture {
    std::optional<Expected<Value>> result;

    auto sink() {
        return [this](Expected<Value> const& r) { result = r; };
    }
    [[nodiscard]] auto code() const -> Error::Code { return result->error().code; }
};

// volume/muted only, with a setVolume request keyed "volume".
auto simpleVolumeFeature() -> FeaturePtr<MediaElement> {
    RequestMap<MediaElement> requests;
    requests.emplace("setVolume", RequestConfig<MediaElement>{.key = "volume", .handler = [](Value const& input, Ctx const& ctx) -> Value {
                                                                  ctx.target.setVolume(input.valueOr(0.0));
                                                                  return ctx.target.volume();
                                                              }});
    return createFeature(FeatureConfig<MediaElement>{
            .name         = "simpleVolume",
            .initialState = {{"volume", 1.0}, {"muted", false}},
            .getSnapshot  = [](MediaElement& target) -> Record { return {{"volume", target.volume()}, {"muted", target.muted()}}; },
            .subscribe =
                    [](FeatureSubscribeContext<MediaElement> const& ctx) {
                        ctx.own(ctx.target.addEventListener("volumechange", [update = ctx.update](MediaEvent const&) { update(); }));
                    },
            .request = std::move(requests)});
}

// A nested default plus a request whose handler throws a non standard exception.
auto nestedFeature() -> FeaturePtr<MediaElement> {
    RequestMap<MediaElement> requests;
    requests.emplace("explode", RequestConfig<MediaElement>{.key = "explode", .handler = [](Value const&, Ctx const&) -> Value { throw 7; }});
    return createFeature(FeatureConfig<MediaElement>{
            .name         = "nested",
            .initialState = {{"nested", Value::object({{"v", 0}, {"label", "none"}})}},
            .request      = std::move(requests)});
}

auto collectErrors(std::vector<ErrorContext>& errors) -> std::function<void(ErrorContext const&)> {
    return [&errors](ErrorContext const& context) { errors.push_back(context); };
}

} // namespace

TEST_SUITE("store.store") {
    TEST_CASE("Attach reads the target snapshot immediately") {
        EventLoop    loop;
        MediaElement element{loop};
        element.setVolume(0.8);

        Store<MediaElement> store{loop, {.features = {simpleVolumeFeature()}}};
        CHECK(store.get("volume") == Value{1.0});
        auto detach = store.attach(element);
        REQUIRE(detach.has_value());
        CHECK(store.attached());
        CHECK(store.target() == &element);
        CHECK(*store.get("volume").as<double>() == doctest::Approx(0.8));
        CHECK(store.get("muted") == Value{false});
    }

    TEST_CASE("Back to back requests under one key supersede") {
        EventLoop               loop;
        MediaElement            element{loop};
        std::vector<ErrorContext> errors;
        Store<MediaElement>     store{loop, {.features = {simpleVolumeFeature()}, .onError = collectErrors(errors)}};
        REQUIRE(store.attach(element));

        Capture first;
        Capture second;
        store.request("setVolume", 0.3).then(first.sink());
        store.request("setVolume", 0.7).then(second.sink());
        loop.runUntilIdle();

        REQUIRE(first.result.has_value());
        CHECK(isCancellation(first.result->error()));
        REQUIRE(second.result.has_value());
        CHECK(*second.result->value().as<double>() == doctest::Approx(0.7));
        CHECK(element.volume() == doctest::Approx(0.7));
        CHECK(*store.get("volume").as<double>() == doctest::Approx(0.7));

        // The superseded request is still routed to onError.
        REQUIRE(errors.size() == 1);
        CHECK(errors.front().source == ErrorSource::Request);
        CHECK(errors.front().origin == "setVolume");
        CHECK(errors.front().error.code == Error::Code::Superseded);
    }

    TEST_CASE("Target events update state until detach") {
        EventLoop           loop;
        MediaElement        element{loop};
        Store<MediaElement> store{loop, {.features = {simpleVolumeFeature()}}};
        auto                detach = store.attach(element);
        REQUIRE(detach);
        CHECK(element.listenerCount() == 1);

        int  rounds = 0;
        auto sub    = store.subscribe({"volume"}, [&](ReactiveState::Keys const&) { ++rounds; });
        element.setVolume(0.2);
        loop.runMicrotasks();
        CHECK(*store.get("volume").as<double>() == doctest::Approx(0.2));
        CHECK(rounds == 1);

        (*detach)();
        CHECK_FALSE(store.attached());
        CHECK(element.listenerCount() == 0);
        CHECK(store.get("volume") == Value{1.0});

        element.setVolume(0.6);
        loop.runMicrotasks();
        CHECK(store.get("volume") == Value{1.0});
    }

    TEST_CASE("A detacher only ends its own attach") {
        EventLoop           loop;
        MediaElement        first{loop};
        MediaElement        second{loop};
        second.setVolume(0.4);
        Store<MediaElement> store{loop, {.features = {simpleVolumeFeature()}}};

        auto stale = store.attach(first);
        auto live  = store.attach(second);
        REQUIRE(stale);
        REQUIRE(live);
        CHECK(first.listenerCount() == 0);
        CHECK(second.listenerCount() == 1);

        (*stale)();
        CHECK(store.attached());
        CHECK(store.target() == &second);
        CHECK(*store.get("volume").as<double>() == doctest::Approx(0.4));
        (*live)();
        CHECK_FALSE(store.attached());
    }

    TEST_CASE("Destroy is terminal and idempotent") {
        EventLoop                 loop;
        MediaElement              element{loop};
        std::vector<ErrorContext> errors;
        bool                      setupAborted = false;
        Store<MediaElement>       store{loop,
                                  {.features = {simpleVolumeFeature()},
                                   .onSetup  = [&](SetupContext<MediaElement> const& ctx) {
                                       ctx.signal.addListener([&](Error const& reason) { setupAborted = reason.code == Error::Code::Destroyed; }).detach();
                                   },
                                   .onError = collectErrors(errors)}};
        REQUIRE(store.attach(element));

        store.destroy();
        CHECK(store.destroyed());
        CHECK_FALSE(store.attached());
        CHECK(setupAborted);
        CHECK(element.listenerCount() == 0);
        CHECK_NOTHROW(store.destroy());

        Capture late;
        store.request("setVolume", 0.5).then(late.sink());
        CHECK(late.code() == Error::Code::Destroyed);
        auto again = store.attach(element);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code == Error::Code::Destroyed);
        CHECK(errors.back().error.code == Error::Code::Destroyed);
    }

    TEST_CASE("Requests fail without a target or a matching name") {
        EventLoop                 loop;
        std::vector<ErrorContext> errors;
        Store<MediaElement>       store{loop, {.features = {simpleVolumeFeature()}, .onError = collectErrors(errors)}};
        CHECK(store.hasRequest("setVolume"));
        CHECK(store.requestNames() == std::vector<std::string>{"setVolume"});

        Capture noTarget;
        Capture unknown;
        store.request("setVolume", 0.5).then(noTarget.sink());
        store.request("launch").then(unknown.sink());
        CHECK(noTarget.code() == Error::Code::NoTarget);
        CHECK(unknown.code() == Error::Code::NoSuchRequest);
        REQUIRE(errors.size() == 2);
        CHECK(errors[1].origin == "launch");
    }

    TEST_CASE("Detach aborts running requests") {
        EventLoop                loop;
        MediaElement             element{loop};
        RequestMap<MediaElement> requests;
        AbortSignal              seen;
        requests.emplace("wait", RequestConfig<MediaElement>{.handler = [&](Value const&, Ctx const& ctx) -> Future<Value> {
                                                                 seen = ctx.signal;
                                                                 return waitForEvent(ctx.target, "never", ctx.signal);
                                                             }});
        Store<MediaElement> store{loop, {.features = {createFeature(FeatureConfig<MediaElement>{.request = std::move(requests)})}}};
        REQUIRE(store.attach(element));

        Capture capture;
        store.request("wait").then(capture.sink());
        loop.runMicrotasks();
        CHECK(store.queue().status("wait") == TaskStatus::Pending);
        CHECK(element.listenerCount("never") == 1);

        store.detach();
        REQUIRE(capture.result.has_value());
        CHECK(capture.code() == Error::Code::Aborted);
        CHECK(seen.aborted());
        CHECK(element.listenerCount() == 0);
        CHECK(store.queue().task("wait")->cancelled);
    }

    TEST_CASE("Guards gate the handler") {
        EventLoop                loop;
        MediaElement             element{loop};
        Promise<bool>            decision;
        int                      ran = 0;
        RequestMap<MediaElement> requests;
        requests.emplace("loaded", RequestConfig<MediaElement>{.guard   = {hasSourceGuard()},
                                                               .handler = [&](Value const&, Ctx const&) { ++ran; }});
        requests.emplace("later", RequestConfig<MediaElement>{.guard   = {[&](GuardContext<MediaElement> const&) -> GuardResult { return decision.future(); }},
                                                              .handler = [&](Value const&, Ctx const&) { ++ran; }});
        std::vector<ErrorContext> errors;
        Store<MediaElement>       store{loop, {.features = {createFeature(FeatureConfig<MediaElement>{.request = std::move(requests)})}, .onError = collectErrors(errors)}};
        REQUIRE(store.attach(element));

        Capture rejected;
        store.request("loaded").then(rejected.sink());
        loop.runMicrotasks();
        CHECK(rejected.code() == Error::Code::Rejected);
        CHECK(rejected.result->error().message.value() == "guard rejected loaded");
        CHECK(ran == 0);

        Capture deferred;
        store.request("later").then(deferred.sink());
        loop.runMicrotasks();
        CHECK_FALSE(deferred.result.has_value());
        decision.resolve(true);
        REQUIRE(deferred.result.has_value());
        CHECK(deferred.result->has_value());
        CHECK(ran == 1);
        CHECK(errors.size() == 1);
    }

    TEST_CASE("Cancel lists abort other keys before queueing") {
        EventLoop                loop;
        MediaElement             element{loop};
        RequestMap<MediaElement> requests;
        requests.emplace("slow", RequestConfig<MediaElement>{.key     = "a",
                                                             .handler = [](Value const&, Ctx const& ctx) { return waitForEvent(ctx.target, "never", ctx.signal); }});
        requests.emplace("stop", RequestConfig<MediaElement>{.key = "b", .cancel = std::vector<std::string>{"a"}, .handler = [](Value const&, Ctx const&) {}});
        requests.emplace("byInput", RequestConfig<MediaElement>{
                                            .key     = [](Value const& input) { return input.valueOr<std::string>("x"); },
                                            .handler = [](Value const& input, Ctx const&) { return input; }});
        Store<MediaElement> store{loop, {.features = {createFeature(FeatureConfig<MediaElement>{.request = std::move(requests)})}}};
        REQUIRE(store.attach(element));

        Capture slow;
        store.request("slow").then(slow.sink());
        loop.runMicrotasks();
        store.request("stop");
        REQUIRE(slow.result.has_value());
        CHECK(slow.code() == Error::Code::Aborted);

        store.request("byInput", "custom-key");
        CHECK(store.queue().task("byInput")->key == "custom-key");
        loop.runMicrotasks();
    }

    TEST_CASE("Handler errors reject and reach onError") {
        EventLoop                loop;
        MediaElement             element{loop};
        RequestMap<MediaElement> requests;
        requests.emplace("explode", RequestConfig<MediaElement>{.handler = [](Value const&, Ctx const&) -> Value { throw std::runtime_error("kaboom"); }});
        std::vector<ErrorContext> errors;
        Store<MediaElement>       store{loop, {.features = {createFeature(FeatureConfig<MediaElement>{.request = std::move(requests)})}, .onError = collectErrors(errors)}};
        REQUIRE(store.attach(element));

        Capture capture;
        store.request("explode").then(capture.sink());
        loop.runMicrotasks();
        CHECK(capture.code() == Error::Code::HandlerError);
        REQUIRE(errors.size() == 1);
        CHECK(errors.front().error.message.value() == "kaboom");
    }

    TEST_CASE("A throwing feature subscription is isolated") {
        EventLoop    loop;
        MediaElement element{loop};
        element.setVolume(0.3);
        auto broken = createFeature(FeatureConfig<MediaElement>{
                .name         = "broken",
                .initialState = {{"brokenFlag", true}},
                .subscribe    = [](FeatureSubscribeContext<MediaElement> const&) { throw std::runtime_error("no listeners for you"); }});
        std::vector<ErrorContext> errors;
        Store<MediaElement>       store{loop, {.features = {broken, simpleVolumeFeature()}, .onError = collectErrors(errors)}};
        REQUIRE(store.attach(element));

        REQUIRE(errors.size() == 1);
        CHECK(errors.front().source == ErrorSource::Subscribe);
        CHECK(errors.front().origin == "broken");
        CHECK(store.get("brokenFlag") == Value{true});
        CHECK(element.listenerCount("volumechange") == 1);
        CHECK(*store.get("volume").as<double>() == doctest::Approx(0.3));
    }

    TEST_CASE("Hooks run with their signals") {
        EventLoop                loop;
        MediaElement             element{loop};
        std::vector<std::string> calls;
        AbortSignal              attachSignal;
        Store<MediaElement>      store{loop,
                                  {.features = {simpleVolumeFeature()},
                                   .onSetup  = [&](SetupContext<MediaElement> const& ctx) {
                                       calls.push_back("setup");
                                       CHECK_FALSE(ctx.store.attached());
                                   },
                                   .onAttach = [&](AttachContext<MediaElement> const& ctx) {
                                       calls.push_back("attach");
                                       attachSignal = ctx.signal;
                                       CHECK(ctx.store.get("volume") == Value{1.0});
                                   }}};
        REQUIRE(store.attach(element));
        CHECK(calls == std::vector<std::string>{"setup", "attach"});
        store.detach();
        CHECK(attachSignal.aborted());
        CHECK(attachSignal.reason()->message.value() == "detached");
    }

    TEST_CASE("Attach delivers one notification round") {
        EventLoop    loop;
        MediaElement element{loop};
        element.setVolume(0.5);
        element.setMuted(true);
        Store<MediaElement> store{loop, {.features = {simpleVolumeFeature()}}};
        int                 rounds = 0;
        auto                sub    = store.subscribe([&](ReactiveState::Keys const& changed) {
            ++rounds;
            CHECK(changed == ReactiveState::Keys{"muted", "volume"});
        });
        REQUIRE(store.attach(element));
        loop.runMicrotasks();
        CHECK(rounds == 1);
    }

    TEST_CASE("Computed values follow store state") {
        EventLoop           loop;
        MediaElement        element{loop};
        Store<MediaElement> store{loop, {.features = {simpleVolumeFeature()}}};
        auto                loud = store.computed({"volume"}, [](Record const& selected) -> Value { return selected.at("volume").valueOr(0.0) > 0.5; });
        REQUIRE(store.attach(element));
        CHECK(loud->current() == Value{true});
        element.setVolume(0.1);
        loop.runMicrotasks();
        CHECK(loud->current() == Value{false});
    }

    TEST_CASE("Errors fall back to the injected logger") {
        struct Sink : LogSink {
            void log(std::string const& message, std::set<std::string> const&, std::source_location const&) override { lines.push_back(message); }
            std::vector<std::string> lines;
        };
        auto                sink = std::make_shared<Sink>();
        EventLoop           loop;
        Store<MediaElement> store{loop, {.features = {simpleVolumeFeature()}, .logger = sink}};
        store.request("setVolume", 0.5);
        REQUIRE(sink->lines.size() == 1);
        CHECK(sink->lines.front() == "[request:setVolume] no_target:no target attached");

        store.reportError(ErrorContext{.source = ErrorSource::Request, .origin = "x", .error = Error{Error::Code::Superseded, "superseded by x"}});
        CHECK(sink->lines.size() == 1);
    }

    TEST_CASE("Stores built from one feature keep separate nested state") {
        EventLoop           loop;
        auto                feature = nestedFeature();
        Store<MediaElement> first{loop, {.features = {feature}}};
        Store<MediaElement> second{loop, {.features = {feature}}};

        int  firstRounds  = 0;
        int  secondRounds = 0;
        auto firstSub     = first.subscribe({"nested"}, [&](ReactiveState::Keys const&) { ++firstRounds; });
        auto secondSub    = second.subscribe({"nested"}, [&](ReactiveState::Keys const&) { ++secondRounds; });

        auto nested   = second.get("nested").nested();
        auto defaults = feature->initialState().at("nested").nested();
        REQUIRE(nested);
        CHECK(nested != first.get("nested").nested());
        CHECK(nested != defaults);
        CHECK(nested->parent().get() == &second.state());

        nested->set("v", 1);
        loop.runMicrotasks();
        CHECK(secondRounds == 1);
        CHECK(firstRounds == 0);
        CHECK(first.get("nested").nested()->get("v") == Value{0});
        CHECK(defaults->get("v") == Value{0});
        CHECK(defaults->parent() == nullptr);
    }

    TEST_CASE("Detach restores nested defaults in place") {
        EventLoop           loop;
        MediaElement        element{loop};
        Store<MediaElement> store{loop, {.features = {nestedFeature()}}};
        auto                detach = store.attach(element);
        REQUIRE(detach);

        auto nested = store.get("nested").nested();
        REQUIRE(nested);
        nested->set("v", 42);
        nested->set("label", "live");
        loop.runUntilIdle();

        int  rounds = 0;
        auto sub    = store.subscribe({"nested"}, [&rounds](ReactiveState::Keys const&) { ++rounds; });
        (*detach)();
        loop.runUntilIdle();
        CHECK(store.get("nested").nested() == nested);
        CHECK(nested->get("v") == Value{0});
        CHECK(nested->get("label") == Value{"none"});
        CHECK(rounds == 1);
        CHECK(store.initialState().at("nested").nested()->get("v") == Value{0});

        // Attaching again finds the defaults already in place.
        REQUIRE(store.attach(element));
        loop.runUntilIdle();
        CHECK(rounds == 1);
    }

    TEST_CASE("Handlers throwing non standard exceptions reject as handler errors") {
        EventLoop                 loop;
        MediaElement              element{loop};
        std::vector<ErrorContext> errors;
        Store<MediaElement>       store{loop, {.features = {nestedFeature()}, .onError = collectErrors(errors)}};
        REQUIRE(store.attach(element));

        Capture result;
        store.request("explode").then(result.sink());
        loop.runUntilIdle();
        REQUIRE(result.result.has_value());
        CHECK(result.code() == Error::Code::HandlerError);
        CHECK(result.result->error().message.value() == "unknown exception");
        CHECK(store.queue().status("explode") == TaskStatus::Error);
        REQUIRE(errors.size() == 1);
        CHECK(errors.front().origin == "explode");
    }
}
