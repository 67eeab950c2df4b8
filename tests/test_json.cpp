#include <gtest/gtest.h>

#include "recdecrypt/json.hpp"

#include <string>

namespace json = recdecrypt::json;

namespace {

TEST(JsonTest, ParsesNestedDocument) {
    json::Value root = json::Parse(R"({"a": [1, true, null, "x"], "b": {"c": 18446744073709551615}})");
    ASSERT_EQ(root.type(), json::Value::Type::Object);
    const json::Value* a = root.Find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(a->items().size(), 4u);
    EXPECT_EQ(a->items()[0].AsUint64(), 1u);
    EXPECT_TRUE(a->items()[1].AsBool());
    EXPECT_TRUE(a->items()[2].is_null());
    EXPECT_EQ(a->items()[3].AsString(), "x");
    EXPECT_EQ(root.Find("b")->Find("c")->AsUint64(), 18446744073709551615ull);
    EXPECT_EQ(root.Find("missing"), nullptr);
}

TEST(JsonTest, DecodesEscapesAndSurrogatePairs) {
    json::Value value = json::Parse(R"("q\"\\\/\b\f\n\r\t \u00e9 \ud83d\ude00")");
    EXPECT_EQ(value.AsString(), "q\"\\/\b\f\n\r\t \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JsonTest, RejectsMalformedDocuments) {
    EXPECT_THROW(json::Parse(""), json::Error);
    EXPECT_THROW(json::Parse("{\"a\":1,}"), json::Error);
    EXPECT_THROW(json::Parse("[1 2]"), json::Error);
    EXPECT_THROW(json::Parse("\"unterminated"), json::Error);
    EXPECT_THROW(json::Parse("\"\\ud800\""), json::Error);
    EXPECT_THROW(json::Parse("01"), json::Error);
    EXPECT_THROW(json::Parse("{} x"), json::Error);
    EXPECT_THROW(json::Parse("\"tab\there\""), json::Error);
}

TEST(JsonTest, RejectsExcessiveNesting) {
    std::string deep(200, '[');
    deep += std::string(200, ']');
    EXPECT_THROW(json::Parse(deep), json::Error);
}

TEST(JsonTest, TypeMismatchesThrow) {
    json::Value root = json::Parse(R"({"n": -1, "f": 1.5, "s": "x", "big": 18446744073709551616})");
    EXPECT_THROW(root.Find("n")->AsUint64(), json::Error);
    EXPECT_THROW(root.Find("f")->AsUint64(), json::Error);
    EXPECT_THROW(root.Find("s")->AsUint64(), json::Error);
    EXPECT_THROW(root.Find("s")->AsBool(), json::Error);
    EXPECT_THROW(root.Find("big")->AsUint64(), json::Error);
    EXPECT_THROW(root.Find("s")->Find("x"), json::Error);
}

TEST(JsonTest, DumpEscapesAndKeepsMemberOrder) {
    json::Value root = json::Value::MakeObject();
    root.Set("z", json::Value::MakeUint(7));
    root.Set("a", json::Value::MakeString("line\n\"quoted\"\x01"));
    json::Value list = json::Value::MakeArray();
    list.Push(json::Value::MakeBool(false));
    list.Push(json::Value());
    root.Set("list", std::move(list));
    EXPECT_EQ(json::Dump(root), R"({"z":7,"a":"line\n\"quoted\"\u0001","list":[false,null]})");
}

TEST(JsonTest, DuplicateKeysResolveToLastValue) {
    json::Value root = json::Parse(R"({"k": 1, "k": 2})");
    EXPECT_EQ(root.Find("k")->AsUint64(), 2u);
}

}  // namespace
