#pragma once

#include "core/uuid.hpp"

#include <optional>
#include <string_view>

namespace uuidpp {

// Predefined name-space ids (RFC 4122 appendix C)
const Uuid& namespace_dns();   // 6ba7b810-9dad-11d1-80b4-00c04fd430c8
const Uuid& namespace_url();   // 6ba7b811-9dad-11d1-80b4-00c04fd430c8
const Uuid& namespace_oid();   // 6ba7b812-9dad-11d1-80b4-00c04fd430c8
const Uuid& namespace_x500();  // 6ba7b814-9dad-11d1-80b4-00c04fd430c8

// Looks up "dns", "url", "oid" or "x500" (case-insensitive)
std::optional<Uuid> namespace_by_name(std::string_view name);

} // namespace uuidpp
