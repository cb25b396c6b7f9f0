#include <mediastore/media/MediaFeatures.hpp>
#include <mediastore/serialization/StateJson.hpp>

#include <doctest/doctest.h>

#include <limits>

using namespace MS;
using json = nlohmann::json;

TEST_SUITE("serialization.state_json") {
    TEST_CASE("Values map onto JSON types") {
        CHECK(StateJson::toJson(Value{}).is_null());
        CHECK(StateJson::toJson(Value{true}) == json(true));
        CHECK(StateJson::toJson(Value{42}) == json(42));
        CHECK(StateJson::toJson(Value{0.5}) == json(0.5));
        CHECK(StateJson::toJson(Value{"hls"}) == json("hls"));

        auto nested = StateJson::toJson(Record{{"media", Value::object({{"volume", 0.5}, {"muted", false}})}, {"ready", true}});
        CHECK(nested == json::parse(R"({"media":{"muted":false,"volume":0.5},"ready":true})"));
    }

    TEST_CASE("Cycles serialize as null") {
        auto root  = ReactiveState::Create();
        auto child = ReactiveState::Create({{"name", "child"}});
        root->set("child", Value{child});
        child->set("back", Value{root});

        auto out = StateJson::toJson(Value{root});
        CHECK(out["child"]["name"] == "child");
        CHECK(out["child"]["back"].is_null());
        child->remove("back");
    }

    TEST_CASE("JSON objects become records") {
        auto record = StateJson::toRecord(json::parse(R"({"volume":0.25,"muted":true,"source":null,"level":{"db":-6}})"));
        REQUIRE(record.has_value());
        CHECK(record->at("volume") == Value{0.25});
        CHECK(record->at("muted") == Value{true});
        CHECK(record->at("source").isNull());
        auto level = record->at("level").nested();
        REQUIRE(level);
        CHECK(level->get("db") == Value{-6});

        auto array = StateJson::toRecord(json::parse(R"({"tags":[1,2]})"));
        REQUIRE_FALSE(array.has_value());
        CHECK(array.error().code == Error::Code::TypeMismatch);
        CHECK(array.error().message.value().starts_with("tags: "));
        CHECK_FALSE(StateJson::toRecord(json(3)).has_value());
    }

    TEST_CASE("Task records carry status and errors") {
        TaskInfo info;
        info.id        = 3;
        info.name      = "setVolume";
        info.key       = "volume";
        info.status    = TaskStatus::Error;
        info.input     = 0.3;
        info.started   = true;
        info.cancelled = true;
        info.error     = Error{Error::Code::Superseded, "superseded by setVolume"};
        info.meta      = RequestMeta::FromEvent("click", true);

        auto out = StateJson::toJson(info);
        CHECK(out["status"] == "error");
        CHECK(out["mode"] == "exclusive");
        CHECK(out["cancelled"] == true);
        CHECK(out["error"]["code"] == "superseded");
        CHECK(out["meta"]["source"] == "user");
        CHECK(out.contains("settled_ms"));
        CHECK_FALSE(out.contains("output"));
    }

    TEST_CASE("Store export") {
        EventLoop    loop;
        MediaElement element{loop};
        MediaStore   store{loop, mediaStoreConfig()};
        REQUIRE(store.attach(element));
        store.request("changeVolume", 0.5);
        loop.runUntilIdle();

        auto out = StateJson::exportStore(store);
        CHECK(out["attached"] == true);
        CHECK(out["destroyed"] == false);
        CHECK(out["state"]["volume"] == 0.5);
        CHECK(out["state"]["volumeLevel"] == "medium");
        CHECK(out["tasks"]["changeVolume"]["status"] == "success");
        CHECK(out["tasks"]["changeVolume"]["output"] == 0.5);
    }
}
