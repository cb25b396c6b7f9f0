#include <mediastore/core/Value.hpp>

#include <mediastore/state/ReactiveState.hpp>

#include <cmath>

namespace MS {

Value::Value(Nested nested) {
    if (nested)
        storage_ = std::move(nested);
}

auto Value::object(Record fields) -> Value {
    return Value{ReactiveState::Create(std::move(fields))};
}

auto Value::nested() const -> Nested {
    if (auto const* v = std::get_if<Nested>(&storage_))
        return *v;
    return nullptr;
}

auto Value::typeName() const -> std::string_view {
    switch (storage_.index()) {
    case 0:
        return "null";
    case 1:
        return "bool";
    case 2:
        return "int";
    case 3:
        return "double";
    case 4:
        return "string";
    case 5:
        return "object";
    }
    return "unknown";
}

auto Value::mismatch(std::string_view expected) const -> Error {
    std::string message{"expected "};
    message.append(expected);
    message.append(", found ");
    message.append(typeName());
    return Error{Error::Code::TypeMismatch, std::move(message)};
}

namespace {

auto sameNumber(double lhs, double rhs) -> bool {
    if (std::isnan(lhs) && std::isnan(rhs))
        return true;
    if (lhs == 0.0 && rhs == 0.0)
        return std::signbit(lhs) == std::signbit(rhs);
    return lhs == rhs;
}

} // namespace

auto sameValue(Value const& lhs, Value const& rhs) -> bool {
    if (lhs.isNumber() && rhs.isNumber()) {
        if (lhs.isInt() && rhs.isInt())
            return std::get<std::int64_t>(lhs.storage()) == std::get<std::int64_t>(rhs.storage());
        return sameNumber(*lhs.as<double>(), *rhs.as<double>());
    }
    if (lhs.storage().index() != rhs.storage().index())
        return false;
    return std::visit(
            [&rhs](auto const& value) -> bool {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::same_as<T, std::monostate>) {
                    return true;
                } else {
                    return value == std::get<T>(rhs.storage());
                }
            },
            lhs.storage());
}

auto operator==(Value const& lhs, Value const& rhs) -> bool {
    return sameValue(lhs, rhs);
}

} // namespace MS
