#include "adapters/json_adapter.hpp"
#include "codec/text_codec.hpp"
#include "core/errors.hpp"

#include <string>

namespace uuidpp {

namespace {

constexpr size_t kMinTextLength = 32;

} // anonymous namespace

void to_json(nlohmann::json& j, const Uuid& uuid) {
    j = to_string(uuid);
}

void from_json(const nlohmann::json& j, Uuid& uuid) {
    if (!j.is_string()) {
        throw FormatError("expected JSON string for UUID", j.dump());
    }

    const auto& text = j.get_ref<const std::string&>();
    if (text.size() < kMinTextLength) {
        throw FormatError("UUID string too short", text);
    }

    uuid = from_string(text);
}

void to_json(nlohmann::json& j, const NullUuid& value) {
    if (!value.valid) {
        j = nullptr;
        return;
    }
    to_json(j, value.uuid);
}

void from_json(const nlohmann::json& j, NullUuid& value) {
    if (j.is_null()) {
        value = NullUuid();
        return;
    }
    Uuid uuid;
    from_json(j, uuid);
    value = NullUuid(uuid);
}

} // namespace uuidpp
