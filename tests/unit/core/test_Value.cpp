#include <mediastore/core/Value.hpp>
#include <mediastore/state/ReactiveState.hpp>

#include <doctest/doctest.h>

#include <cmath>
#include <limits>

using namespace MS;

TEST_SUITE("core.value") {
    TEST_CASE("Alternatives and type names") {
        CHECK(Value{}.isNull());
        CHECK(Value{nullptr}.typeName() == "null");
        CHECK(Value{true}.typeName() == "bool");
        CHECK(Value{3}.typeName() == "int");
        CHECK(Value{0.5}.typeName() == "double");
        CHECK(Value{"text"}.typeName() == "string");
        CHECK(Value::object().typeName() == "object");
        CHECK(Value{std::shared_ptr<ReactiveState>{}}.isNull());
    }

    TEST_CASE("Checked access") {
        Value number{7};
        REQUIRE(number.as<int>().has_value());
        CHECK(*number.as<int>() == 7);
        CHECK(*number.as<double>() == doctest::Approx(7.0));

        auto mismatch = Value{"loud"}.as<double>();
        REQUIRE_FALSE(mismatch.has_value());
        CHECK(mismatch.error().code == Error::Code::TypeMismatch);
        CHECK(mismatch.error().message.value() == "expected double, found string");

        CHECK_FALSE(Value{1.5}.as<int>().has_value());
        CHECK_FALSE(Value{1}.as<bool>().has_value());
        CHECK(Value{}.valueOr<std::string>("fallback") == "fallback");
    }

    TEST_CASE("Identity equality") {
        SUBCASE("numbers") {
            auto const nan = std::numeric_limits<double>::quiet_NaN();
            CHECK(sameValue(Value{nan}, Value{nan}));
            CHECK_FALSE(sameValue(Value{0.0}, Value{-0.0}));
            CHECK(sameValue(Value{1}, Value{1.0}));
            CHECK_FALSE(sameValue(Value{1}, Value{2}));
        }
        SUBCASE("mixed kinds") {
            CHECK_FALSE(sameValue(Value{1}, Value{true}));
            CHECK_FALSE(sameValue(Value{"1"}, Value{1}));
            CHECK(sameValue(Value{}, Value{nullptr}));
            CHECK(Value{"a"} == Value{std::string{"a"}});
        }
        SUBCASE("nested states compare by identity") {
            auto a = Value::object({{"x", 1}});
            auto b = Value::object({{"x", 1}});
            CHECK_FALSE(sameValue(a, b));
            CHECK(sameValue(a, Value{a.nested()}));
        }
    }
}
