#pragma once
#include <mediastore/core/Error.hpp>

#include <concepts>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace MS {

class ReactiveState;
class Value;

// Ordered name -> value record. Used for initial state, snapshots and patches.
using Record = std::map<std::string, Value, std::less<>>;

/**
 * Value: the dynamically typed cell stored in a ReactiveState.
 *
 * Alternatives: null, bool, int64, double, string and a nested ReactiveState.
 * Equality follows identity semantics for nested states and Object.is semantics
 * for numbers (NaN equals NaN, +0 differs from -0, int and double compare by value).
 */
class Value {
public:
    using Nested  = std::shared_ptr<ReactiveState>;
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, Nested>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value)
        : storage_(value) {}
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T value)
        : storage_(static_cast<std::int64_t>(value)) {}
    Value(double value)
        : storage_(value) {}
    Value(float value)
        : storage_(static_cast<double>(value)) {}
    Value(char const* value)
        : storage_(std::string{value}) {}
    Value(std::string value)
        : storage_(std::move(value)) {}
    Value(std::string_view value)
        : storage_(std::string{value}) {}
    Value(Nested nested);

    // Builds a nested container from a record. The container is adopted by the
    // first ReactiveState it is assigned into.
    static auto object(Record fields = {}) -> Value;

    [[nodiscard]] auto isNull() const -> bool { return std::holds_alternative<std::monostate>(storage_); }
    [[nodiscard]] auto isBool() const -> bool { return std::holds_alternative<bool>(storage_); }
    [[nodiscard]] auto isInt() const -> bool { return std::holds_alternative<std::int64_t>(storage_); }
    [[nodiscard]] auto isDouble() const -> bool { return std::holds_alternative<double>(storage_); }
    [[nodiscard]] auto isNumber() const -> bool { return isInt() || isDouble(); }
    [[nodiscard]] auto isString() const -> bool { return std::holds_alternative<std::string>(storage_); }
    [[nodiscard]] auto isNested() const -> bool { return std::holds_alternative<Nested>(storage_); }

    [[nodiscard]] auto storage() const -> Storage const& { return storage_; }
    [[nodiscard]] auto nested() const -> Nested;
    [[nodiscard]] auto typeName() const -> std::string_view;

    // Checked access. Integers widen to double; nothing else converts.
    template <typename T>
    [[nodiscard]] auto as() const -> Expected<T>;

    template <typename T>
    [[nodiscard]] auto valueOr(T fallback) const -> T {
        auto value = as<T>();
        return value ? *value : fallback;
    }

    friend auto operator==(Value const& lhs, Value const& rhs) -> bool;

private:
    [[nodiscard]] auto mismatch(std::string_view expected) const -> Error;

    Storage storage_;
};

// Strict identity comparison used for change detection.
[[nodiscard]] auto sameValue(Value const& lhs, Value const& rhs) -> bool;

template <typename T>
auto Value::as() const -> Expected<T> {
    if constexpr (std::same_as<T, bool>) {
        if (auto const* v = std::get_if<bool>(&storage_))
            return *v;
        return std::unexpected(mismatch("bool"));
    } else if constexpr (std::same_as<T, double> || std::same_as<T, float>) {
        if (auto const* v = std::get_if<double>(&storage_))
            return static_cast<T>(*v);
        if (auto const* v = std::get_if<std::int64_t>(&storage_))
            return static_cast<T>(*v);
        return std::unexpected(mismatch("double"));
    } else if constexpr (std::integral<T>) {
        if (auto const* v = std::get_if<std::int64_t>(&storage_))
            return static_cast<T>(*v);
        return std::unexpected(mismatch("int"));
    } else if constexpr (std::same_as<T, std::string>) {
        if (auto const* v = std::get_if<std::string>(&storage_))
            return *v;
        return std::unexpected(mismatch("string"));
    } else if constexpr (std::same_as<T, Nested>) {
        if (auto const* v = std::get_if<Nested>(&storage_))
            return *v;
        return std::unexpected(mismatch("object"));
    } else {
        static_assert(sizeof(T) == 0, "Value::as<T> supports bool, integers, double, std::string and nested states");
    }
}

} // namespace MS
