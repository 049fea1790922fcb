/**
 * @file test_merge.cpp
 * @brief Tests for merge-patch application using Google Test
 *
 * Includes the examples from RFC 7396 Appendix A.
 */

#include <gtest/gtest.h>
#include "patchy/Merge.hpp"

#include <string>
#include <vector>

using namespace patchy;

// ============================================================================
// Simple merges
// ============================================================================

TEST(MergePatch, EmptyPatchLeavesObjectUnchanged) {
    Value target = {{"age", 30}, {"id", 1}};
    const Value before = target;
    merge_patch(target, Value::object());
    EXPECT_EQ(target, before);
}

TEST(MergePatch, EmptyPatchLeavesNestedObjectUnchanged) {
    Value target = {{"profile", {{"bio", "x"}, {"tags", {"a", "b"}}}}};
    const Value before = target;
    merge_patch(target, Value::object());
    EXPECT_EQ(target, before);
}

TEST(MergePatch, ReplacesField) {
    Value target = {{"age", 30}, {"id", 1}};
    merge_patch(target, {{"age", 31}});
    EXPECT_EQ(target, Value({{"age", 31}, {"id", 1}}));
}

TEST(MergePatch, AddsField) {
    Value target = {{"a", 1}};
    merge_patch(target, {{"b", 2}});
    EXPECT_EQ(target["a"], 1);
    EXPECT_EQ(target["b"], 2);
}

// ============================================================================
// Null entries delete
// ============================================================================

TEST(MergePatch, NullDeletesField) {
    Value target = {{"age", 30}, {"id", 1}};
    merge_patch(target, {{"age", nullptr}});
    EXPECT_FALSE(target.contains("age"));
    EXPECT_EQ(target["id"], 1);
}

TEST(MergePatch, NullForMissingFieldIsNoOp) {
    Value target = {{"id", 1}};
    merge_patch(target, {{"ghost", nullptr}});
    EXPECT_EQ(target, Value({{"id", 1}}));
}

TEST(MergePatch, NestedNullDeletesOnlyNestedField) {
    Value target = {
        {"profile", {
            {"bio", "Software engineer"},
            {"avatar_url", "https://example.com/alice-old.jpg"}
        }}
    };
    merge_patch(target, {{"profile", {{"avatar_url", nullptr}}}});

    EXPECT_EQ(target["profile"]["bio"], "Software engineer");
    EXPECT_FALSE(target["profile"].contains("avatar_url"));
}

TEST(MergePatch, NullInsideArrayIsKept) {
    Value target = {{"a", 1}};
    merge_patch(target, {{"list", {1, nullptr, 3}}});
    ASSERT_TRUE(target["list"].is_array());
    EXPECT_TRUE(target["list"][1].is_null());
}

// ============================================================================
// Coercion and wholesale replacement
// ============================================================================

TEST(MergePatch, ObjectPatchCoercesScalarTarget) {
    Value target = 5;
    merge_patch(target, {{"k", "v"}});
    EXPECT_EQ(target, Value({{"k", "v"}}));
}

TEST(MergePatch, ObjectPatchCoercesNestedScalarField) {
    Value target = {{"profile", "none"}};
    merge_patch(target, {{"profile", {{"bio", "x"}}}});
    EXPECT_EQ(target, Value({{"profile", {{"bio", "x"}}}}));
}

TEST(MergePatch, ObjectPatchCreatesMissingField) {
    Value target = Value::object();
    merge_patch(target, {{"profile", {{"bio", "x"}, {"gone", nullptr}}}});
    EXPECT_EQ(target, Value({{"profile", {{"bio", "x"}}}}));
}

TEST(MergePatch, ArrayPatchReplacesWholeArray) {
    Value target = {{"tags", {"a", "b", "c"}}};
    merge_patch(target, {{"tags", {"b"}}});
    ASSERT_TRUE(target["tags"].is_array());
    EXPECT_EQ(target["tags"].size(), 1u);
    EXPECT_EQ(target["tags"][0], "b");
}

TEST(MergePatch, TopLevelNullReplacesTarget) {
    Value target = {{"a", "foo"}};
    merge_patch(target, nullptr);
    EXPECT_TRUE(target.is_null());
}

TEST(MergePatch, TopLevelScalarReplacesTarget) {
    Value target = {{"a", "foo"}};
    merge_patch(target, "bar");
    EXPECT_EQ(target, "bar");
}

// ============================================================================
// merged() leaves its input alone
// ============================================================================

TEST(Merged, ReturnsUpdatedCopy) {
    const Value base = {{"age", 30}, {"id", 1}};
    const Value result = merged(base, {{"age", 31}});

    EXPECT_EQ(result, Value({{"age", 31}, {"id", 1}}));
    EXPECT_EQ(base["age"], 30);
}

// ============================================================================
// RFC 7396 Appendix A
// ============================================================================

struct RfcCase {
    const char* target;
    const char* patch;
    const char* expected;
};

TEST(MergePatch, Rfc7396AppendixA) {
    const std::vector<RfcCase> cases = {
        {R"({"a":"b"})",               R"({"a":"c"})",                   R"({"a":"c"})"},
        {R"({"a":"b"})",               R"({"b":"c"})",                   R"({"a":"b","b":"c"})"},
        {R"({"a":"b"})",               R"({"a":null})",                  R"({})"},
        {R"({"a":"b","b":"c"})",       R"({"a":null})",                  R"({"b":"c"})"},
        {R"({"a":["b"]})",             R"({"a":"c"})",                   R"({"a":"c"})"},
        {R"({"a":"c"})",               R"({"a":["b"]})",                 R"({"a":["b"]})"},
        {R"({"a":{"b":"c"}})",         R"({"a":{"b":"d","c":null}})",    R"({"a":{"b":"d"}})"},
        {R"({"a":[{"b":"c"}]})",       R"({"a":[1]})",                   R"({"a":[1]})"},
        {R"(["a","b"])",               R"(["c","d"])",                   R"(["c","d"])"},
        {R"({"a":"b"})",               R"(["c"])",                       R"(["c"])"},
        {R"({"a":"foo"})",             R"(null)",                        R"(null)"},
        {R"({"a":"foo"})",             R"("bar")",                       R"("bar")"},
        {R"({"e":null})",              R"({"a":1})",                     R"({"e":null,"a":1})"},
        {R"([1,2])",                   R"({"a":"b","c":null})",          R"({"a":"b"})"},
        {R"({})",                      R"({"a":{"bb":{"ccc":null}}})",   R"({"a":{"bb":{}}})"},
    };

    for (const auto& c : cases) {
        Value target = Value::parse(c.target);
        merge_patch(target, Value::parse(c.patch));
        EXPECT_EQ(target, Value::parse(c.expected))
            << "target=" << c.target << " patch=" << c.patch;
    }
}
