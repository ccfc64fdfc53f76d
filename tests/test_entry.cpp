// tests/test_entry.cpp
//
// Entry serialization and holding normalization.

#include "test_preamble.h"

#include <cmath>
#include <limits>

#include "simpaths/registry/entry.hpp"

using namespace simpaths::registry;

TEST(HoldingTest, NumbersPassThrough)
{
    EXPECT_EQ(normalize_holding(json(0)), 0.0);
    EXPECT_EQ(normalize_holding(json(42)), 42.0);
    EXPECT_EQ(normalize_holding(json(2.5)), 2.5);
}

TEST(HoldingTest, InfinitySpellings)
{
    for (const char *s : {"inf", "INF", "Infinity", "+inf", " inf "})
    {
        auto v = normalize_holding(json(s));
        ASSERT_TRUE(v.has_value()) << s;
        EXPECT_TRUE(std::isinf(*v)) << s;
    }
}

TEST(HoldingTest, NumericStrings)
{
    EXPECT_EQ(normalize_holding(json("1e300")), 1e300);
    EXPECT_EQ(normalize_holding(json("3600")), 3600.0);
}

TEST(HoldingTest, RejectsInvalid)
{
    EXPECT_FALSE(normalize_holding(json(-1)).has_value());
    EXPECT_FALSE(normalize_holding(json("-5")).has_value());
    EXPECT_FALSE(normalize_holding(json("nan")).has_value());
    EXPECT_FALSE(normalize_holding(json("forever")).has_value());
    EXPECT_FALSE(normalize_holding(json("12abc")).has_value());
    EXPECT_FALSE(normalize_holding(json("")).has_value());
    EXPECT_FALSE(normalize_holding(json(nullptr)).has_value());
    EXPECT_FALSE(normalize_holding(json::array()).has_value());
}

TEST(HoldingTest, InfinitySerializesAsString)
{
    EXPECT_EQ(holding_to_json(std::numeric_limits<double>::infinity()), json("inf"));
    EXPECT_EQ(holding_to_json(42.0), json(42.0));
}

TEST(EntryTest, ParsesStoredEntry)
{
    const json j = {{"user", "alice"}, {"holding", "inf"}, {"path", "/as"},
                    {"created", 1700000000.5}, {"file", "/sims/0.txt"}, {"jobid", 7}};
    std::string why;
    auto e = entry_from_json(j, &why);
    ASSERT_TRUE(e.has_value()) << why;
    EXPECT_EQ(e->path, "/as");
    EXPECT_EQ(e->file, "/sims/0.txt");
    EXPECT_EQ(e->user, "alice");
    EXPECT_EQ(e->jobid, json(7));
    EXPECT_DOUBLE_EQ(e->created, 1700000000.5);
    EXPECT_TRUE(std::isinf(e->holding));

    auto again = entry_from_json(entry_to_json(*e));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, *e);
}

TEST(EntryTest, RejectsMalformedEntries)
{
    std::string why;
    EXPECT_FALSE(entry_from_json(json::array(), &why));
    EXPECT_FALSE(entry_from_json(json{{"file", "/x"}, {"holding", 1}}, &why));
    EXPECT_NE(why.find("path"), std::string::npos);
    EXPECT_FALSE(entry_from_json(json{{"path", "/a"}, {"holding", 1}}, &why));
    EXPECT_NE(why.find("file"), std::string::npos);
    EXPECT_FALSE(entry_from_json(json{{"path", "/a"}, {"file", "/x"}, {"holding", "soon"}}, &why));
    EXPECT_NE(why.find("holding"), std::string::npos);
    EXPECT_FALSE(entry_from_json(json{{"path", "/a"}, {"file", "/x"}, {"holding", 1}, {"created", "today"}}, &why));
}

TEST(EntryTest, RegistryKeyIsAuthoritative)
{
    const json doc = {{"/you", {{"path", "/stale"}, {"file", "/sims/1.h5"}, {"holding", 0.0}, {"created", 5.0}}}};
    auto reg = registry_from_json(doc);
    ASSERT_TRUE(reg.has_value());
    ASSERT_EQ(reg->count("/you"), 1u);
    EXPECT_EQ(reg->at("/you").path, "/you");
    EXPECT_EQ(registry_to_json(*reg)["/you"]["path"], "/you");
}

TEST(EntryTest, OneBadEntryRejectsDocument)
{
    const json doc = {{"/ok", {{"path", "/ok"}, {"file", "/f"}, {"holding", 1}, {"created", 5.0}}},
                      {"/bad", {{"path", "/bad"}}}};
    std::string why;
    EXPECT_FALSE(registry_from_json(doc, &why).has_value());
    EXPECT_NE(why.find("/bad"), std::string::npos);
    EXPECT_FALSE(registry_from_json(json::array(), &why).has_value());
}

TEST(EntryTest, RegistryEntryWithoutCreatedIsRejected)
{
    const json doc = {{"/old", {{"path", "/old"}, {"file", "/f"}, {"holding", 42.0}}}};
    std::string why;
    EXPECT_FALSE(registry_from_json(doc, &why).has_value());
    EXPECT_NE(why.find("created"), std::string::npos) << why;
    EXPECT_TRUE(entry_from_json(doc["/old"]).has_value());
}
