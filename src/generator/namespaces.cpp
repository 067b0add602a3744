#include "generator/namespaces.hpp"
#include "codec/text_codec.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace uuidpp {

const Uuid& namespace_dns() {
    static const Uuid ns = from_string("6ba7b810-9dad-11d1-80b4-00c04fd430c8");
    return ns;
}

const Uuid& namespace_url() {
    static const Uuid ns = from_string("6ba7b811-9dad-11d1-80b4-00c04fd430c8");
    return ns;
}

const Uuid& namespace_oid() {
    static const Uuid ns = from_string("6ba7b812-9dad-11d1-80b4-00c04fd430c8");
    return ns;
}

const Uuid& namespace_x500() {
    static const Uuid ns = from_string("6ba7b814-9dad-11d1-80b4-00c04fd430c8");
    return ns;
}

std::optional<Uuid> namespace_by_name(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "dns") return namespace_dns();
    if (lower == "url") return namespace_url();
    if (lower == "oid") return namespace_oid();
    if (lower == "x500") return namespace_x500();
    return std::nullopt;
}

} // namespace uuidpp
