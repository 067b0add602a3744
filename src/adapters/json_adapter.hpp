#pragma once

#include "core/null_uuid.hpp"
#include "core/uuid.hpp"

#include <nlohmann/json.hpp>

namespace uuidpp {

// nlohmann::json hooks, found through ADL:
//   nlohmann::json j = uuid;        -> "6ba7b810-9dad-11d1-80b4-00c04fd430c8"
//   auto u = j.get<uuidpp::Uuid>();
// Deserialization throws FormatError for non-strings, strings shorter than
// 32 characters and anything from_string rejects.
void to_json(nlohmann::json& j, const Uuid& uuid);
void from_json(const nlohmann::json& j, Uuid& uuid);

// Invalid values serialize to null; null deserializes to an invalid value
void to_json(nlohmann::json& j, const NullUuid& value);
void from_json(const nlohmann::json& j, NullUuid& value);

} // namespace uuidpp
