/**
 * @file test_uuid_parse.cpp
 * @brief Unit tests for UUID text parsing and its error descriptions
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <uuidcore/core/uuid.hpp>

#include <string>
#include <vector>

using namespace uuidcore::core;
using ::testing::HasSubstr;

namespace {

std::string parseError(const std::string& text) {
    try {
        Uuid::parse(text);
    } catch (const InvalidUuid& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MALFORMED_TEXT);
        EXPECT_EQ(e.actualLength(), text.size());
        return e.what();
    }
    ADD_FAILURE() << "expected \"" << text << "\" to be rejected";
    return "";
}

}  // namespace

// =============================================================================
// Accepted forms
// =============================================================================

TEST(UuidParseTest, Hyphenated) {
    EXPECT_EQ(Uuid::parse("6ba7b810-9dad-11d1-80b4-00c04fd430c8"), NAMESPACE_DNS);
}

TEST(UuidParseTest, Uppercase) {
    EXPECT_EQ(Uuid::parse("6BA7B810-9DAD-11D1-80B4-00C04FD430C8"), NAMESPACE_DNS);
}

TEST(UuidParseTest, MixedCase) {
    EXPECT_EQ(Uuid::parse("6Ba7B810-9dAd-11D1-80b4-00C04fd430C8"), NAMESPACE_DNS);
}

TEST(UuidParseTest, Simple) {
    EXPECT_EQ(Uuid::parse("6ba7b8109dad11d180b400c04fd430c8"), NAMESPACE_DNS);
}

TEST(UuidParseTest, Braced) {
    EXPECT_EQ(Uuid::parse("{6ba7b811-9dad-11d1-80b4-00c04fd430c8}"), NAMESPACE_URL);
}

TEST(UuidParseTest, Urn) {
    EXPECT_EQ(Uuid::parse("urn:uuid:6ba7b812-9dad-11d1-80b4-00c04fd430c8"), NAMESPACE_OID);
}

TEST(UuidParseTest, NilAndMax) {
    EXPECT_TRUE(Uuid::parse("00000000-0000-0000-0000-000000000000").isNil());
    EXPECT_TRUE(Uuid::parse("FFFFFFFF-FFFF-FFFF-FFFF-FFFFFFFFFFFF").isMax());
}

// =============================================================================
// Validity predicate
// =============================================================================

TEST(UuidValidTest, KnownInputs) {
    EXPECT_FALSE(Uuid::isValid("not-a-uuid"));
    EXPECT_TRUE(Uuid::isValid("6ba7b810-9dad-11d1-80b4-00c04fd430c8"));
}

TEST(UuidValidTest, AgreesWithParse) {
    const std::vector<std::string> inputs = {
        "",
        "not-a-uuid",
        "6ba7b810-9dad-11d1-80b4-00c04fd430c8",
        "6ba7b8109dad11d180b400c04fd430c8",
        "{6ba7b810-9dad-11d1-80b4-00c04fd430c8}",
        "urn:uuid:6ba7b810-9dad-11d1-80b4-00c04fd430c8",
        "6ba7b810-9dad-11d1-80b4-00c04fd430c",
        "6ba7b810-9dad-11d1-80b4-00c04fd430c8a",
        "6ba7b8109-dad-11d1-80b4-00c04fd430c8",
        "6ba7b810-9dad-11d1-80b4-00c04fd430cg",
        "6ba7b810-9dad-11d1-80b400c04fd430c8",
        "{6ba7b810-9dad-11d1-80b4-00c04fd430c8",
        "6ba7b810 9dad 11d1 80b4 00c04fd430c8",
        "URN:UUID:6ba7b810-9dad-11d1-80b4-00c04fd430c8",
    };
    for (const auto& text : inputs) {
        bool parsed = true;
        try {
            Uuid::parse(text);
        } catch (const InvalidUuid&) {
            parsed = false;
        }
        EXPECT_EQ(Uuid::isValid(text), parsed) << text;
        EXPECT_EQ(Uuid::tryParse(text).has_value(), parsed) << text;
    }
}

TEST(UuidValidTest, TryParseReturnsValue) {
    auto uuid = Uuid::tryParse("6ba7b814-9dad-11d1-80b4-00c04fd430c8");
    ASSERT_TRUE(uuid.has_value());
    EXPECT_EQ(*uuid, NAMESPACE_X500);
    EXPECT_FALSE(Uuid::tryParse("6ba7b814").has_value());
}

// =============================================================================
// Error descriptions
// =============================================================================

TEST(UuidParseErrorTest, Empty) {
    EXPECT_EQ(parseError(""), "invalid length: expected 32 or 36 characters, found 0");
}

TEST(UuidParseErrorTest, BadCharacterReportsIndex) {
    EXPECT_EQ(parseError("not-a-uuid"), "invalid character 'n' at index 0");
    EXPECT_EQ(parseError("6ba7b810-9dad-11d1-80b4-00c04fd430cg"), "invalid character 'g' at index 35");
}

TEST(UuidParseErrorTest, BadCharacterIndexIncludesPrefix) {
    EXPECT_EQ(parseError("urn:uuid:6ba7b810-9dad-11d1-80b4-00c04fd430cz"),
              "invalid character 'z' at index 44");
}

TEST(UuidParseErrorTest, SimpleTooShort) {
    EXPECT_EQ(parseError("6ba7b8109dad11d180b400c04fd430c"),
              "invalid length: expected 32 or 36 characters, found 31");
}

TEST(UuidParseErrorTest, SimpleTooLong) {
    EXPECT_EQ(parseError("6ba7b8109dad11d180b400c04fd430c8ff"),
              "invalid length: expected 32 or 36 characters, found 34");
}

TEST(UuidParseErrorTest, WrongGroupCount) {
    EXPECT_EQ(parseError("6ba7b810-9dad-11d1-80b400c04fd430c8"),
              "invalid group count: expected 5, found 4");
    EXPECT_EQ(parseError("6ba7b810-9dad-11d1-80b4-00c0-4fd430c8"),
              "invalid group count: expected 5, found 6");
}

TEST(UuidParseErrorTest, HyphenMisplaced) {
    EXPECT_EQ(parseError("6ba7b8109-dad-11d1-80b4-00c04fd430c8"),
              "invalid group length in group 1: expected 8, found 9");
    EXPECT_EQ(parseError("6ba7b810-9dad-11d1-80b4-00c04fd430c"),
              "invalid group length in group 5: expected 12, found 11");
}

TEST(UuidParseErrorTest, UnbalancedBrace) {
    EXPECT_THAT(parseError("{6ba7b810-9dad-11d1-80b4-00c04fd430c8"),
                HasSubstr("invalid character '{'"));
}

TEST(UuidParseErrorTest, WhitespaceIsRejected) {
    EXPECT_EQ(parseError(" 6ba7b810-9dad-11d1-80b4-00c04fd430c8"),
              "invalid character ' ' at index 0");
}

TEST(UuidParseErrorTest, IsInvalidArgument) {
    EXPECT_THROW(Uuid::parse("xyz"), std::invalid_argument);
}
