#include "codec/text_codec.hpp"
#include "core/errors.hpp"

#include <array>
#include <ostream>

namespace uuidpp {

namespace {

constexpr size_t kMinTextLength = 32;
constexpr size_t kMaxTextLength = 45;
constexpr std::string_view kUrnPrefix = "urn:uuid:";
constexpr std::array<size_t, 5> kHexGroups = {8, 4, 4, 4, 12};
constexpr char kHexDigits[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Decodes an even-length run of hex digits into out
void decode_hex(std::string_view group, uint8_t* out, std::string_view input) {
    for (size_t i = 0; i < group.size(); i += 2) {
        int hi = hex_value(group[i]);
        int lo = hex_value(group[i + 1]);
        if (hi < 0 || lo < 0) {
            throw FormatError("invalid UUID hex character", std::string(input));
        }
        *out++ = static_cast<uint8_t>((hi << 4) | lo);
    }
}

void encode_hex(const uint8_t* in, size_t count, std::string& out) {
    for (size_t i = 0; i < count; ++i) {
        out.push_back(kHexDigits[in[i] >> 4]);
        out.push_back(kHexDigits[in[i] & 0x0f]);
    }
}

} // anonymous namespace

std::string to_string(const Uuid& uuid) {
    std::string text;
    text.reserve(kCanonicalLength);

    const uint8_t* bytes = uuid.data();
    size_t offset = 0;
    for (size_t i = 0; i < kHexGroups.size(); ++i) {
        if (i > 0) {
            text.push_back('-');
        }
        encode_hex(bytes + offset, kHexGroups[i] / 2, text);
        offset += kHexGroups[i] / 2;
    }
    return text;
}

std::string format(const Uuid& uuid, TextFormat text_format) {
    switch (text_format) {
        case TextFormat::Braced:
            return "{" + to_string(uuid) + "}";
        case TextFormat::Urn:
            return std::string(kUrnPrefix) + to_string(uuid);
        case TextFormat::Canonical:
            break;
    }
    return to_string(uuid);
}

Uuid from_string(std::string_view text) {
    if (text.size() < kMinTextLength) {
        throw FormatError("UUID string too short", std::string(text));
    }
    if (text.size() > kMaxTextLength) {
        throw FormatError("UUID string too long", std::string(text));
    }

    std::string_view rest = text;
    bool braced = false;

    if (rest.substr(0, kUrnPrefix.size()) == kUrnPrefix) {
        rest.remove_prefix(kUrnPrefix.size());
    } else if (rest.front() == '{') {
        braced = true;
        rest.remove_prefix(1);
    }

    Uuid uuid;
    uint8_t* out = uuid.data();

    for (size_t i = 0; i < kHexGroups.size(); ++i) {
        const size_t width = kHexGroups[i];

        if (i > 0) {
            if (rest.empty() || rest.front() != '-') {
                throw FormatError("invalid UUID string format", std::string(text));
            }
            rest.remove_prefix(1);
        }

        if (rest.size() < width) {
            throw FormatError("UUID string too short", std::string(text));
        }

        decode_hex(rest.substr(0, width), out, text);
        rest.remove_prefix(width);
        out += width / 2;
    }

    if (braced) {
        if (rest.empty()) {
            throw FormatError("UUID string missing closing brace", std::string(text));
        }
        if (rest.front() != '}') {
            throw FormatError("UUID string too long", std::string(text));
        }
        rest.remove_prefix(1);
    }

    if (!rest.empty()) {
        throw FormatError("UUID string too long", std::string(text));
    }

    return uuid;
}

Uuid from_string_or_nil(std::string_view text) {
    try {
        return from_string(text);
    } catch (const FormatError&) {
        return kNil;
    }
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid) {
    return os << to_string(uuid);
}

} // namespace uuidpp
