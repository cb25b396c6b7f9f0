#include <mediastore/store/Request.hpp>

namespace MS {

auto resolveRequestKey(RequestKey const& key, std::string_view name, Value const& input) -> std::string {
    if (auto const* literal = std::get_if<std::string>(&key))
        return literal->empty() ? std::string{name} : *literal;
    auto const& fn       = std::get<std::function<std::string(Value const&)>>(key);
    auto        resolved = fn ? fn(input) : std::string{};
    return resolved.empty() ? std::string{name} : resolved;
}

auto resolveRequestCancel(RequestCancel const& cancel, Value const& input) -> CancelPlan {
    CancelPlan plan;
    if (std::holds_alternative<CancelAll>(cancel)) {
        plan.all = true;
    } else if (auto const* keys = std::get_if<std::vector<std::string>>(&cancel)) {
        plan.keys = *keys;
    } else if (auto const* fn = std::get_if<std::function<std::vector<std::string>(Value const&)>>(&cancel)) {
        if (*fn)
            plan.keys = (*fn)(input);
    }
    return plan;
}

} // namespace MS
