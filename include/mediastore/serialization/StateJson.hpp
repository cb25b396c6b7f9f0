#pragma once
#include <mediastore/core/Error.hpp>
#include <mediastore/core/Value.hpp>
#include <mediastore/store/StoreBase.hpp>
#include <mediastore/task/Queue.hpp>
#include <mediastore/task/TaskInfo.hpp>

#include <nlohmann/json.hpp>

namespace MS::StateJson {

// Nested states become objects; a state reached again through itself becomes null.
auto toJson(Value const& value) -> nlohmann::json;
auto toJson(Record const& record) -> nlohmann::json;
auto toJson(Error const& error) -> nlohmann::json;
auto toJson(RequestMeta const& meta) -> nlohmann::json;
auto toJson(TaskInfo const& task) -> nlohmann::json;
auto toJson(Queue::TaskMap const& tasks) -> nlohmann::json;

// Objects become nested states, arrays are rejected.
auto toValue(nlohmann::json const& json) -> Expected<Value>;
auto toRecord(nlohmann::json const& json) -> Expected<Record>;

// { "state": ..., "tasks": ..., "attached": bool, "destroyed": bool }
auto exportStore(StoreBase const& store) -> nlohmann::json;

} // namespace MS::StateJson
