#include <gtest/gtest.h>
#include "adapters/json_adapter.hpp"
#include "codec/text_codec.hpp"
#include "core/errors.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace uuidpp;

namespace {

const std::string kCanonical = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";

} // namespace

// Test: UUID serializes as its canonical string
TEST(JsonAdapterTest, SerializeCanonical) {
    nlohmann::json j = from_string(kCanonical);
    ASSERT_TRUE(j.is_string());
    EXPECT_EQ(j.get<std::string>(), kCanonical);
    EXPECT_EQ(j.dump(), "\"" + kCanonical + "\"");
}

// Test: Every accepted text form deserializes
TEST(JsonAdapterTest, DeserializeAcceptedForms) {
    const Uuid expected = from_string(kCanonical);
    EXPECT_EQ(nlohmann::json(kCanonical).get<Uuid>(), expected);
    EXPECT_EQ(nlohmann::json("{" + kCanonical + "}").get<Uuid>(), expected);
    EXPECT_EQ(nlohmann::json("urn:uuid:" + kCanonical).get<Uuid>(), expected);
}

// Test: UUIDs nest inside objects and arrays
TEST(JsonAdapterTest, NestedDocument) {
    nlohmann::json doc = nlohmann::json::parse(R"({
        "id": "6ba7b811-9dad-11d1-80b4-00c04fd430c8",
        "links": ["6ba7b812-9dad-11d1-80b4-00c04fd430c8", "6ba7b814-9dad-11d1-80b4-00c04fd430c8"]
    })");

    Uuid id = doc.at("id").get<Uuid>();
    std::vector<Uuid> links = doc.at("links").get<std::vector<Uuid>>();

    EXPECT_EQ(to_string(id), "6ba7b811-9dad-11d1-80b4-00c04fd430c8");
    ASSERT_EQ(links.size(), 2u);
    EXPECT_EQ(to_string(links[1]), "6ba7b814-9dad-11d1-80b4-00c04fd430c8");

    nlohmann::json out;
    out["id"] = id;
    out["links"] = links;
    EXPECT_EQ(out, doc);
}

// Test: Non-string JSON values are rejected
TEST(JsonAdapterTest, RejectNonString) {
    EXPECT_THROW(nlohmann::json(42).get<Uuid>(), FormatError);
    EXPECT_THROW(nlohmann::json(nullptr).get<Uuid>(), FormatError);
    EXPECT_THROW(nlohmann::json::array().get<Uuid>(), FormatError);
    EXPECT_THROW(nlohmann::json(true).get<Uuid>(), FormatError);
}

// Test: Strings under 32 characters are too short
TEST(JsonAdapterTest, RejectShortString) {
    try {
        nlohmann::json("6ba7b810").get<Uuid>();
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.reason(), "UUID string too short");
        EXPECT_EQ(e.input(), "6ba7b810");
    }
}

// Test: Malformed text fails with the parser's reason
TEST(JsonAdapterTest, RejectMalformedString) {
    try {
        nlohmann::json("6ba7b8109dad-11d1-80b4-00c04fd430c8").get<Uuid>();
        FAIL() << "Expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.reason(), "invalid UUID string format");
    }
}

// Test: Invalid NullUuid serializes to null and back
TEST(JsonAdapterTest, NullUuidNull) {
    nlohmann::json j = NullUuid();
    EXPECT_TRUE(j.is_null());

    NullUuid value = nlohmann::json(nullptr).get<NullUuid>();
    EXPECT_FALSE(value.valid);
    EXPECT_FALSE(value.has_value());
}

// Test: Valid NullUuid serializes as a string, Nil included
TEST(JsonAdapterTest, NullUuidValid) {
    nlohmann::json j = NullUuid(from_string(kCanonical));
    EXPECT_EQ(j.get<std::string>(), kCanonical);

    NullUuid nil = nlohmann::json("00000000-0000-0000-0000-000000000000").get<NullUuid>();
    EXPECT_TRUE(nil.valid);
    EXPECT_TRUE(nil.uuid.is_nil());
    EXPECT_NE(nil, NullUuid());
}

// Test: NullUuid still rejects non-null garbage
TEST(JsonAdapterTest, NullUuidRejectsGarbage) {
    EXPECT_THROW(nlohmann::json(7).get<NullUuid>(), FormatError);
    EXPECT_THROW(nlohmann::json("short").get<NullUuid>(), FormatError);
}
