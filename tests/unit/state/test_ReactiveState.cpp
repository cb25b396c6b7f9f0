#include <mediastore/state/ReactiveState.hpp>

#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace MS;

namespace {

auto joined(ReactiveState::Keys const& keys) -> std::string {
    std::string out;
    for (auto const& key : keys) {
        if (!out.empty())
            out += ",";
        out += key;
    }
    return out;
}

} // namespace

TEST_SUITE("state.reactive_state") {
    TEST_CASE("Reads and writes apply immediately") {
        auto state = ReactiveState::Create({{"volume", 1.0}, {"muted", false}});
        CHECK(state->get<double>("volume").value() == doctest::Approx(1.0));
        CHECK(state->get("missing").isNull());
        CHECK(state->contains("muted"));
        CHECK(state->keys() == std::vector<std::string>{"muted", "volume"});

        CHECK(state->set("volume", 0.5));
        CHECK_FALSE(state->set("volume", 0.5));
        CHECK(state->get<double>("volume").value() == doctest::Approx(0.5));
        CHECK(state->patch({{"volume", 0.5}, {"muted", true}, {"extra", 1}}) == 2);
        CHECK(state->remove("extra"));
        CHECK_FALSE(state->remove("extra"));
        CHECK(state->size() == 2);
    }

    TEST_CASE("Notifications are coalesced to the end of the turn") {
        EventLoop                        loop;
        auto                             state = ReactiveState::Create(loop, {{"a", 0}, {"b", 0}});
        std::vector<std::string>         rounds;
        auto                             sub = state->subscribe([&](ReactiveState::Keys const& changed) { rounds.push_back(joined(changed)); });

        state->set("a", 1);
        state->set("b", 1);
        state->set("a", 2);
        CHECK(rounds.empty());
        CHECK(state->hasPendingChanges());
        loop.runMicrotasks();
        CHECK(rounds == std::vector<std::string>{"a,b"});
        CHECK_FALSE(state->hasPendingChanges());
    }

    TEST_CASE("Writes with no net change do not notify") {
        EventLoop loop;
        auto      state = ReactiveState::Create(loop, {{"a", 1}});
        int       calls = 0;
        auto      sub   = state->subscribe([&](ReactiveState::Keys const&) { ++calls; });

        state->batch([&] {
            state->set("a", 1);
            state->set("a", 2);
            state->set("a", 1);
        });
        loop.runMicrotasks();
        CHECK(calls == 0);

        state->set("fresh", 1);
        state->remove("fresh");
        loop.runMicrotasks();
        CHECK(calls == 0);
    }

    TEST_CASE("Keyed observers only hear about their keys") {
        EventLoop loop;
        auto      state  = ReactiveState::Create(loop, {{"volume", 1.0}, {"paused", true}});
        int       volume = 0;
        int       all    = 0;
        auto      a      = state->subscribe({"volume", "muted"}, [&](ReactiveState::Keys const&) { ++volume; });
        auto      b      = state->subscribe([&](ReactiveState::Keys const&) { ++all; });
        CHECK(state->observerCount() == 2);

        state->set("paused", false);
        loop.runMicrotasks();
        CHECK(volume == 0);
        CHECK(all == 1);

        state->set("volume", 0.2);
        loop.runMicrotasks();
        CHECK(volume == 1);

        a.unsubscribe();
        CHECK(state->observerCount() == 1);
    }

    TEST_CASE("Batch holds notifications until the outermost batch ends") {
        auto state = ReactiveState::Create({{"x", 0}}, Schedulers::immediate());
        int  calls = 0;
        auto sub   = state->subscribe([&](ReactiveState::Keys const&) { ++calls; });

        auto result = state->batch([&] {
            state->set("x", 1);
            state->batch([&] { state->set("x", 2); });
            CHECK(calls == 0);
            return 7;
        });
        CHECK(result == 7);
        CHECK(calls == 1);

        state->set("x", 3);
        CHECK(calls == 2);
    }

    TEST_CASE("Batch ends even when the body throws") {
        auto state = ReactiveState::Create({{"x", 0}}, Schedulers::immediate());
        int  calls = 0;
        auto sub   = state->subscribe([&](ReactiveState::Keys const&) { ++calls; });
        CHECK_THROWS_AS(state->batch([&] {
            state->set("x", 1);
            throw std::runtime_error("boom");
        }),
                        std::runtime_error);
        CHECK(calls == 1);
        state->set("x", 2);
        CHECK(calls == 2);
    }

    TEST_CASE("Without a scheduler only flush notifies") {
        auto state = ReactiveState::Create({{"x", 0}});
        int  calls = 0;
        auto sub   = state->subscribe([&](ReactiveState::Keys const&) { ++calls; });
        state->set("x", 1);
        CHECK(calls == 0);
        state->flush();
        CHECK(calls == 1);
        state->flush();
        CHECK(calls == 1);
    }

    TEST_CASE("Nested changes bubble to the holding key") {
        EventLoop loop;
        auto      root = ReactiveState::Create(loop, {{"media", Value::object({{"volume", 1.0}})}, {"other", 0}});
        auto      child = root->get<Value::Nested>("media").value();
        REQUIRE(child);
        CHECK(child->parent() == root);
        CHECK(child->parentKey() == "media");

        std::vector<std::string> rootRounds;
        std::vector<std::string> childRounds;
        auto a = root->subscribe([&](ReactiveState::Keys const& changed) { rootRounds.push_back(joined(changed)); });
        auto b = child->subscribe([&](ReactiveState::Keys const& changed) { childRounds.push_back(joined(changed)); });

        child->set("volume", 0.4);
        root->set("other", 1);
        loop.runMicrotasks();
        CHECK(childRounds == std::vector<std::string>{"volume"});
        CHECK(rootRounds == std::vector<std::string>{"media,other"});

        SUBCASE("batching on the root covers the child") {
            root->batch([&] {
                child->set("volume", 0.9);
                child->set("volume", 0.4);
            });
            loop.runMicrotasks();
            CHECK(rootRounds.size() == 1);
            CHECK(childRounds.size() == 1);
        }

        SUBCASE("replacing a nested value releases it") {
            root->set("media", Value::object({{"volume", 0.0}}));
            loop.runMicrotasks();
            CHECK_FALSE(child->parent());
            child->set("volume", 0.1);
            loop.runMicrotasks();
            CHECK(rootRounds.size() == 2);
        }
    }

    TEST_CASE("A state cannot adopt itself or an ancestor") {
        auto root  = ReactiveState::Create();
        auto child = ReactiveState::Create();
        root->set("child", Value{child});
        CHECK(child->parent() == root);

        child->set("loop", Value{root});
        CHECK_FALSE(root->parent());
        root->set("self", Value{root});
        CHECK_FALSE(root->parent());

        auto other = ReactiveState::Create();
        other->set("borrowed", Value{child});
        CHECK(child->parent() == root);

        // Break the reference cycles built above.
        child->remove("loop");
        root->remove("self");
    }

    TEST_CASE("Observer exceptions propagate from flush") {
        auto state = ReactiveState::Create({{"x", 0}});
        auto sub   = state->subscribe([](ReactiveState::Keys const&) { throw std::runtime_error("observer"); });
        state->set("x", 1);
        CHECK_THROWS_AS(state->flush(), std::runtime_error);
        CHECK_FALSE(state->hasPendingChanges());
    }

    TEST_CASE("A throwing observer does not hide the change from the others") {
        auto state   = ReactiveState::Create({{"a", 0}});
        int  first   = 0;
        int  second  = 0;
        auto failing = state->subscribe({"a"}, [&first](ReactiveState::Keys const&) {
            ++first;
            throw std::runtime_error("first observer");
        });
        auto counting = state->subscribe({"a"}, [&second](ReactiveState::Keys const& changed) {
            CHECK(changed.contains("a"));
            ++second;
        });

        state->set("a", 1);
        CHECK_THROWS_WITH_AS(state->flush(), "first observer", std::runtime_error);
        CHECK(first == 1);
        CHECK(second == 1);

        failing.unsubscribe();
        state->flush();
        CHECK(second == 1);

        state->set("a", 2);
        state->flush();
        CHECK(second == 2);
    }

    TEST_CASE("Only the first observer exception propagates") {
        auto parent = ReactiveState::Create({{"child", Value::object({{"v", 0}})}});
        auto child  = parent->get("child").nested();
        REQUIRE(child);
        int  reached = 0;
        auto inner   = child->subscribe([](ReactiveState::Keys const&) { throw std::runtime_error("inner"); });
        auto outer   = parent->subscribe([](ReactiveState::Keys const&) { throw std::logic_error("outer"); });
        auto last    = parent->subscribe([&reached](ReactiveState::Keys const&) { ++reached; });

        child->set("v", 1);
        CHECK_THROWS_AS(parent->flush(), std::runtime_error);
        CHECK(reached == 1);
        CHECK_FALSE(parent->hasPendingChanges());
    }

    TEST_CASE("DeepCopy gives nested states fresh containers") {
        auto shared = Value::object({{"v", 0}});
        auto source = Record{{"left", shared}, {"right", shared}, {"plain", 3}};
        auto owner  = ReactiveState::Create(source);

        auto copy = ReactiveState::DeepCopy(source);
        auto left = copy.at("left").nested();
        REQUIRE(left);
        CHECK(left != shared.nested());
        CHECK(left == copy.at("right").nested());
        CHECK(left->parent() == nullptr);
        CHECK(copy.at("plain") == Value{3});

        left->set("v", 5);
        CHECK(shared.nested()->get("v") == Value{0});

        auto state = ReactiveState::Create(copy);
        CHECK(left->parent() == state);
        CHECK(left->parentKey() == "left");
        CHECK(shared.nested()->parent() == owner);
    }

    TEST_CASE("DeepCopy mirrors parent links and survives cycles") {
        auto outer = ReactiveState::Create({{"inner", Value::object({{"v", 1}})}});
        auto inner = outer->get("inner").nested();
        inner->set("back", Value{outer});

        auto copy      = ReactiveState::DeepCopy({{"outer", Value{outer}}});
        auto outerCopy = copy.at("outer").nested();
        REQUIRE(outerCopy);
        auto innerCopy = outerCopy->get("inner").nested();
        REQUIRE(innerCopy);
        CHECK(innerCopy != inner);
        CHECK(innerCopy->parent() == outerCopy);
        CHECK(innerCopy->parentKey() == "inner");
        CHECK(innerCopy->get("back").nested() == outerCopy);

        inner->remove("back");
        innerCopy->remove("back");
    }

    TEST_CASE("Restore resets owned nested states in place") {
        auto defaults = Record{{"volume", 1.0}, {"media", Value::object({{"v", 0}, {"label", "none"}})}};
        auto state    = ReactiveState::Create(ReactiveState::DeepCopy(defaults));
        auto media    = state->get("media").nested();
        REQUIRE(media);

        std::vector<std::string> rounds;
        auto sub = state->subscribe([&rounds](ReactiveState::Keys const& changed) { rounds.push_back(joined(changed)); });

        state->set("volume", 0.5);
        media->set("v", 42);
        state->flush();
        rounds.clear();

        CHECK(state->restore(defaults) == 2);
        state->flush();
        CHECK(state->get("media").nested() == media);
        CHECK(media->get("v") == Value{0});
        CHECK(media->get("label") == Value{"none"});
        CHECK(state->get("volume") == Value{1.0});
        CHECK(rounds == std::vector<std::string>{"media,volume"});

        CHECK(state->restore(defaults) == 0);
        state->flush();
        CHECK(rounds.size() == 1);
        CHECK(defaults.at("media").nested()->parent() == nullptr);
    }

    TEST_CASE("Restore replaces values that are not owned nested states") {
        auto defaults = Record{{"media", Value::object({{"v", 0}})}};
        auto state    = ReactiveState::Create({{"media", 7}});
        CHECK(state->restore(defaults) == 1);
        auto media = state->get("media").nested();
        REQUIRE(media);
        CHECK(media != defaults.at("media").nested());
        CHECK(media->parent() == state);
        CHECK(media->get("v") == Value{0});
    }
}
