#include "adapters/sql_adapter.hpp"
#include "codec/text_codec.hpp"
#include "core/errors.hpp"

#include <string_view>

namespace uuidpp {

const char* sql_type_name(const SqlValue& value) {
    switch (value.index()) {
        case 0: return "null";
        case 1: return "blob";
        case 2: return "text";
        case 3: return "integer";
        case 4: return "real";
        case 5: return "boolean";
    }
    return "unknown";
}

SqlValue to_sql_value(const Uuid& uuid) {
    return to_string(uuid);
}

SqlValue to_sql_value(const NullUuid& value) {
    if (!value.valid) {
        return std::monostate{};
    }
    return to_sql_value(value.uuid);
}

void scan(const SqlValue& src, Uuid& out) {
    if (const auto* blob = std::get_if<std::vector<uint8_t>>(&src)) {
        if (blob->size() == Uuid::kSize) {
            out = from_bytes(*blob);
            return;
        }
        out = from_string(std::string_view(reinterpret_cast<const char*>(blob->data()), blob->size()));
        return;
    }

    if (const auto* text = std::get_if<std::string>(&src)) {
        out = from_string(*text);
        return;
    }

    throw UnsupportedSourceTypeError(sql_type_name(src));
}

void scan(const SqlValue& src, NullUuid& out) {
    if (std::holds_alternative<std::monostate>(src)) {
        out = NullUuid();
        return;
    }
    // out is untouched when the value does not convert
    Uuid uuid;
    scan(src, uuid);
    out = NullUuid(uuid);
}

} // namespace uuidpp
