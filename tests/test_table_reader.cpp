// tests/test_table_reader.cpp
//
// Condition parsing, row orientations and the SQLite reader.

#include "helpers/registry_fixture.h"

#include "helpers/sqlite_fixture.h"
#include "simpaths/registry/table_reader.hpp"

using namespace simpaths::registry;

class SqliteTableReaderTest : public RegistryFixture
{
  protected:
    void SetUp() override
    {
        RegistryFixture::SetUp();
        db_ = sims_dir_ / "runs.sqlite";
        test_utils::make_runs_db(db_);
    }

    fs::path db_;
    SqliteTableReader reader_;
};

namespace
{

TableData sample()
{
    TableData t;
    t.columns = {"a", "b"};
    t.rows = {{json(1), json("x")}, {json(2), json("y")}};
    return t;
}

} // namespace

TEST(TableOptionsTest, ParsesFormatsAndOrientations)
{
    EXPECT_EQ(parse_table_format("json"), TableFormat::Json);
    EXPECT_EQ(parse_table_format("json:dict"), TableFormat::JsonDict);
    EXPECT_FALSE(parse_table_format("csv").has_value());
    EXPECT_EQ(parse_orient("split"), Orient::Split);
    EXPECT_EQ(parse_orient("records"), Orient::Records);
    EXPECT_EQ(parse_orient("index"), Orient::Index);
    EXPECT_EQ(parse_orient("columns"), Orient::Columns);
    EXPECT_EQ(parse_orient("values"), Orient::Values);
    EXPECT_FALSE(parse_orient("table").has_value());
}

TEST(ConditionTest, ParsesOperatorsAndValues)
{
    auto c = parse_condition("id >= 2");
    ASSERT_TRUE(c.ok) << c.message;
    EXPECT_EQ(c.content().column, "id");
    EXPECT_EQ(c.content().op, ">=");
    EXPECT_EQ(c.content().value, json(2));

    auto s = parse_condition("name==\"beta\"");
    ASSERT_TRUE(s.ok);
    EXPECT_EQ(s.content().op, "==");
    EXPECT_EQ(s.content().value, json("beta"));

    auto bare = parse_condition("name != gamma");
    ASSERT_TRUE(bare.ok);
    EXPECT_EQ(bare.content().op, "!=");
    EXPECT_EQ(bare.content().value, json("gamma"));

    auto lt = parse_condition("score<1");
    ASSERT_TRUE(lt.ok);
    EXPECT_EQ(lt.content().op, "<");
}

TEST(ConditionTest, RejectsMalformed)
{
    EXPECT_FALSE(parse_condition("id 2").ok);
    EXPECT_FALSE(parse_condition("id = 2").ok);
    EXPECT_FALSE(parse_condition("1bad == 2").ok);
    EXPECT_FALSE(parse_condition("== 2").ok);
}

TEST(OrientTest, AllOrientations)
{
    const auto t = sample();
    EXPECT_EQ(to_oriented_json(t, Orient::Split),
              json::parse(R"({"columns":["a","b"],"index":[0,1],"data":[[1,"x"],[2,"y"]]})"));
    EXPECT_EQ(to_oriented_json(t, Orient::Records), json::parse(R"([{"a":1,"b":"x"},{"a":2,"b":"y"}])"));
    EXPECT_EQ(to_oriented_json(t, Orient::Index), json::parse(R"({"0":{"a":1,"b":"x"},"1":{"a":2,"b":"y"}})"));
    EXPECT_EQ(to_oriented_json(t, Orient::Columns), json::parse(R"({"a":{"0":1,"1":2},"b":{"0":"x","1":"y"}})"));
    EXPECT_EQ(to_oriented_json(t, Orient::Values), json::parse(R"([[1,"x"],[2,"y"]])"));
}

TEST(OrientTest, EmptyTableKeepsColumns)
{
    TableData t;
    t.columns = {"a"};
    EXPECT_EQ(to_oriented_json(t, Orient::Split), json::parse(R"({"columns":["a"],"index":[],"data":[]})"));
    EXPECT_EQ(to_oriented_json(t, Orient::Records), json::array());
}

TEST_F(SqliteTableReaderTest, SupportsByExtension)
{
    EXPECT_TRUE(reader_.supports("x.sqlite"));
    EXPECT_TRUE(reader_.supports("x.DB"));
    EXPECT_FALSE(reader_.supports("x.h5"));
    EXPECT_FALSE(reader_.supports("x"));
}

TEST_F(SqliteTableReaderTest, ReadsWholeTable)
{
    auto r = reader_.read(db_, "runs", {});
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.content().columns, (std::vector<std::string>{"id", "name", "score"}));
    ASSERT_EQ(r.content().rows.size(), 3u);
    EXPECT_EQ(r.content().rows[0][1], json("alpha"));
    EXPECT_EQ(r.content().rows[1][2], json(1.5));
    EXPECT_TRUE(r.content().rows[2][2].is_null());
}

TEST_F(SqliteTableReaderTest, AppliesAllConditions)
{
    std::vector<Condition> conds{Condition{"id", ">=", 2}, Condition{"name", "!=", "gamma"}};
    auto r = reader_.read(db_, "runs", conds);
    ASSERT_TRUE(r.ok) << r.message;
    ASSERT_EQ(r.content().rows.size(), 1u);
    EXPECT_EQ(r.content().rows[0][0], json(2));

    auto eq = reader_.read(db_, "runs", {Condition{"name", "==", "alpha"}});
    ASSERT_TRUE(eq.ok);
    ASSERT_EQ(eq.content().rows.size(), 1u);
    EXPECT_EQ(eq.content().rows[0][0], json(1));
}

TEST_F(SqliteTableReaderTest, ReportsErrors)
{
    auto missing_table = reader_.read(db_, "nope", {});
    EXPECT_FALSE(missing_table.ok);
    EXPECT_NE(missing_table.message.find("nope"), std::string::npos);

    EXPECT_FALSE(reader_.read(db_, "runs", {Condition{"id; DROP TABLE runs", "==", 1}}).ok);
    EXPECT_FALSE(reader_.read(db_, "runs", {Condition{"id", "LIKE", 1}}).ok);
    EXPECT_FALSE(reader_.read(sims_dir_ / "absent.sqlite", "runs", {}).ok);
    EXPECT_FALSE(reader_.read(db_, "", {}).ok);

    // The injection attempt above must not have modified the database.
    EXPECT_TRUE(reader_.read(db_, "runs", {}).ok);
}

TEST_F(SqliteTableReaderTest, BlobsRenderAsHex)
{
    const auto blob_db = sims_dir_ / "blob.db";
    test_utils::make_sqlite_db(blob_db, "CREATE TABLE b(v BLOB); INSERT INTO b VALUES(x'00ff10');");
    auto r = reader_.read(blob_db, "b", {});
    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_EQ(r.content().rows[0][0], json("00ff10"));
}
