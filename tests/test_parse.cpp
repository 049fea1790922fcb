/**
 * @file test_parse.cpp
 * @brief Tests for patch text parsing and serialization
 */

#include <gtest/gtest.h>
#include "patchy/Parse.hpp"
#include "patchy/Errors.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace patchy;

// ============================================================================
// parse_patch - text input
// ============================================================================

TEST(ParsePatch, ObjectPatch) {
    auto patch = parse_patch(R"({"age": 31, "profile": {"avatar_url": null}})");
    ASSERT_TRUE(patch.is_object());
    EXPECT_EQ(patch["age"], 31);
    EXPECT_TRUE(patch["profile"]["avatar_url"].is_null());
}

TEST(ParsePatch, WhitespaceAroundDocument) {
    auto patch = parse_patch("\n   {\n \"age\": 31\n }\n  ");
    EXPECT_EQ(patch, Value({{"age", 31}}));
}

TEST(ParsePatch, NonObjectTopLevelIsAccepted) {
    EXPECT_TRUE(parse_patch("null").is_null());
    EXPECT_EQ(parse_patch("[1,2]"), Value({1, 2}));
    EXPECT_EQ(parse_patch(R"("text")"), "text");
}

TEST(ParsePatch, AcceptsStdString) {
    const std::string text = R"({"a":1})";
    EXPECT_EQ(parse_patch(text), Value({{"a", 1}}));
}

// ============================================================================
// parse_patch - byte input
// ============================================================================

TEST(ParsePatch, RawBytes) {
    const std::string text = R"({"name":"new"})";
    const std::vector<std::uint8_t> bytes(text.begin(), text.end());
    EXPECT_EQ(parse_patch(bytes), Value({{"name", "new"}}));
}

TEST(ParsePatch, RawBytesUtf8) {
    const std::vector<std::uint8_t> bytes = {
        '{', '"', 'b', 'i', 'o', '"', ':', '"', 0xC3, 0xA9, '"', '}'
    };
    EXPECT_EQ(parse_patch(bytes)["bio"], "\xC3\xA9");
}

// ============================================================================
// Parse errors
// ============================================================================

TEST(ParsePatch, TruncatedDocumentThrows) {
    EXPECT_THROW(parse_patch(R"({"age":)"), ParseError);
}

TEST(ParsePatch, EmptyInputThrows) {
    EXPECT_THROW(parse_patch(""), ParseError);
    EXPECT_THROW(parse_patch(std::vector<std::uint8_t>{}), ParseError);
}

TEST(ParsePatch, TrailingGarbageThrows) {
    EXPECT_THROW(parse_patch(R"({"a":1} x)"), ParseError);
}

TEST(ParsePatch, ErrorCarriesSourceAndOffset) {
    try {
        parse_patch(R"({"a": tru})", "update.json");
        FAIL() << "Expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.source(), "update.json");
        EXPECT_GT(e.offset(), 0u);
        EXPECT_FALSE(e.details().empty());
        EXPECT_NE(std::string(e.what()).find("update.json"), std::string::npos);
    }
}

TEST(ParsePatch, ParseErrorIsPatchError) {
    EXPECT_THROW(parse_patch("{"), PatchError);
}

// ============================================================================
// dump_patch
// ============================================================================

TEST(DumpPatch, CompactByDefault) {
    const Value patch = {{"b", 1}, {"a", nullptr}};
    EXPECT_EQ(dump_patch(patch), R"({"a":null,"b":1})");
}

TEST(DumpPatch, EmptyPatch) {
    EXPECT_EQ(dump_patch(Value::object()), "{}");
}

TEST(DumpPatch, Indented) {
    const Value patch = {{"a", 1}};
    EXPECT_EQ(dump_patch(patch, 2), "{\n  \"a\": 1\n}");
}

TEST(DumpPatch, ParsesBackToSameTree) {
    const Value patch = {{"age", 31}, {"profile", {{"avatar_url", nullptr}, {"bio", "b"}}}};
    EXPECT_EQ(parse_patch(dump_patch(patch)), patch);
}
