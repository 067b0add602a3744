#pragma once

#include "core/uuid.hpp"

#include <iosfwd>
#include <string>
#include <string_view>

namespace uuidpp {

enum class TextFormat {
    Canonical,  // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    Braced,     // {xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx}
    Urn         // urn:uuid:xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
};

constexpr size_t kCanonicalLength = 36;

// Canonical lowercase 8-4-4-4-12 form, always 36 characters
std::string to_string(const Uuid& uuid);

std::string format(const Uuid& uuid, TextFormat text_format);

/**
 * @brief Parses the bare, braced or URN text form of a UUID.
 *
 * Hex digits may be upper or lower case. Throws FormatError when the input
 * is shorter than 32 or longer than 45 characters, a group separator is not
 * '-', a group contains a non-hex character, a brace is left open, or
 * anything follows the last group.
 */
Uuid from_string(std::string_view text);

// Same as from_string, but returns the Nil UUID on any format error
Uuid from_string_or_nil(std::string_view text);

std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

} // namespace uuidpp
