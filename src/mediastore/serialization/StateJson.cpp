#include <mediastore/serialization/StateJson.hpp>

#include <mediastore/state/ReactiveState.hpp>

#include <set>
#include <string>

namespace MS::StateJson {

namespace {

auto convert(Value const& value, std::set<ReactiveState const*>& path) -> nlohmann::json;

auto convert(Record const& record, std::set<ReactiveState const*>& path) -> nlohmann::json {
    auto object = nlohmann::json::object();
    for (auto const& [key, value] : record)
        object[key] = convert(value, path);
    return object;
}

auto convert(Value const& value, std::set<ReactiveState const*>& path) -> nlohmann::json {
    return std::visit(
            [&path](auto const& alternative) -> nlohmann::json {
                using T = std::decay_t<decltype(alternative)>;
                if constexpr (std::same_as<T, std::monostate>) {
                    return nullptr;
                } else if constexpr (std::same_as<T, Value::Nested>) {
                    if (!alternative || !path.insert(alternative.get()).second)
                        return nullptr;
                    auto json = convert(alternative->snapshot(), path);
                    path.erase(alternative.get());
                    return json;
                } else {
                    return alternative;
                }
            },
            value.storage());
}

auto milliseconds(std::chrono::milliseconds value) -> std::int64_t {
    return static_cast<std::int64_t>(value.count());
}

} // namespace

auto toJson(Value const& value) -> nlohmann::json {
    std::set<ReactiveState const*> path;
    return convert(value, path);
}

auto toJson(Record const& record) -> nlohmann::json {
    std::set<ReactiveState const*> path;
    return convert(record, path);
}

auto toJson(Error const& error) -> nlohmann::json {
    nlohmann::json json{{"code", errorCodeToString(error.code)}};
    json["message"] = error.message ? nlohmann::json(*error.message) : nlohmann::json(nullptr);
    return json;
}

auto toJson(RequestMeta const& meta) -> nlohmann::json {
    return nlohmann::json{{"source", meta.source},
                          {"reason", meta.reason},
                          {"timestamp_ms", milliseconds(meta.timestamp)},
                          {"context", toJson(meta.context)}};
}

auto toJson(TaskInfo const& task) -> nlohmann::json {
    nlohmann::json json{{"id", task.id},
                        {"name", task.name},
                        {"key", task.key},
                        {"mode", taskModeToString(task.mode)},
                        {"status", taskStatusToString(task.status)},
                        {"input", toJson(task.input)},
                        {"started", task.started},
                        {"cancelled", task.cancelled},
                        {"enqueued_ms", milliseconds(task.enqueuedAt)}};
    if (task.started)
        json["started_ms"] = milliseconds(task.startedAt);
    if (task.settled())
        json["settled_ms"] = milliseconds(task.settledAt);
    if (task.output)
        json["output"] = toJson(*task.output);
    if (task.error)
        json["error"] = toJson(*task.error);
    if (task.meta)
        json["meta"] = toJson(*task.meta);
    return json;
}

auto toJson(Queue::TaskMap const& tasks) -> nlohmann::json {
    auto object = nlohmann::json::object();
    for (auto const& [name, task] : tasks)
        object[name] = toJson(task);
    return object;
}

auto toValue(nlohmann::json const& json) -> Expected<Value> {
    switch (json.type()) {
    case nlohmann::json::value_t::null:
        return Value{};
    case nlohmann::json::value_t::boolean:
        return Value{json.get<bool>()};
    case nlohmann::json::value_t::number_integer:
        return Value{json.get<std::int64_t>()};
    case nlohmann::json::value_t::number_unsigned:
        return Value{static_cast<std::int64_t>(json.get<std::uint64_t>())};
    case nlohmann::json::value_t::number_float:
        return Value{json.get<double>()};
    case nlohmann::json::value_t::string:
        return Value{json.get<std::string>()};
    case nlohmann::json::value_t::object: {
        auto record = toRecord(json);
        if (!record)
            return std::unexpected(record.error());
        return Value::object(std::move(*record));
    }
    default:
        break;
    }
    return std::unexpected(Error{Error::Code::TypeMismatch, std::string{"unsupported JSON type "} + json.type_name()});
}

auto toRecord(nlohmann::json const& json) -> Expected<Record> {
    if (!json.is_object())
        return std::unexpected(Error{Error::Code::TypeMismatch, std::string{"expected a JSON object, found "} + json.type_name()});
    Record record;
    for (auto it = json.begin(); it != json.end(); ++it) {
        auto value = toValue(it.value());
        if (!value)
            return std::unexpected(Error{value.error().code, it.key() + ": " + value.error().message.value_or("")});
        record.insert_or_assign(it.key(), std::move(*value));
    }
    return record;
}

auto exportStore(StoreBase const& store) -> nlohmann::json {
    return nlohmann::json{{"state", toJson(store.snapshot())},
                          {"tasks", toJson(store.queue().tasks())},
                          {"attached", store.attached()},
                          {"destroyed", store.destroyed()}};
}

} // namespace MS::StateJson
