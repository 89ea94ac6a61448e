#include <gtest/gtest.h>
#include <sqlite3.h>

#include <string>
#include <vector>

#include "sqlog/errors.hpp"
#include "sqlog/storage/schema.hpp"
#include "test_helpers.hpp"

using namespace sqlog;

TEST(Schema, ReservedColumnsCaseInsensitive)
{
  EXPECT_TRUE(IsReservedColumn("id"));
  EXPECT_TRUE(IsReservedColumn("message"));
  EXPECT_TRUE(IsReservedColumn("Level_Name"));
  EXPECT_TRUE(IsReservedColumn("EXTRA"));
  EXPECT_FALSE(IsReservedColumn("user_id"));
}

TEST(Schema, IdentifierValidation)
{
  EXPECT_TRUE(IsValidIdentifier("logs"));
  EXPECT_TRUE(IsValidIdentifier("_app_logs2"));
  EXPECT_FALSE(IsValidIdentifier(""));
  EXPECT_FALSE(IsValidIdentifier("2logs"));
  EXPECT_FALSE(IsValidIdentifier("logs; DROP TABLE x"));
  EXPECT_FALSE(IsValidIdentifier("my-logs"));
}

TEST(Schema, ColumnOrderReservedThenAdditional)
{
  Schema schema("logs", {{"user_id", "TEXT"}, {"score", "REAL"}});
  const auto& cols = schema.Columns();
  ASSERT_EQ(cols.size(), 16u);
  EXPECT_EQ(cols.front().name, "created_at");
  EXPECT_EQ(cols[13].name, "extra");
  EXPECT_EQ(cols[14].name, "user_id");
  EXPECT_EQ(cols[14].column, Column::Additional);
  EXPECT_EQ(cols[15].type, "REAL");
  EXPECT_TRUE(schema.HasAdditionalField("score"));
  EXPECT_FALSE(schema.HasAdditionalField("message"));
}

TEST(Schema, EmptyTypeDefaultsToText)
{
  Schema schema("logs", {AdditionalField("tenant", "")});
  EXPECT_EQ(schema.AdditionalFields()[0].type, "TEXT");
  EXPECT_EQ(AdditionalField("x").type, "TEXT");
}

TEST(Schema, RejectsReservedCollision)
{
  EXPECT_THROW(Schema("logs", {{"message", "TEXT"}}), SchemaError);
  EXPECT_THROW(Schema("logs", {{"ID", "INTEGER"}}), SchemaError);
}

TEST(Schema, RejectsInvalidNamesAndTypes)
{
  EXPECT_THROW(Schema("bad name", {}), SchemaError);
  EXPECT_THROW(Schema("logs", {{"a b", "TEXT"}}), SchemaError);
  EXPECT_THROW(Schema("logs", {{"x", "TEXT; DROP TABLE logs"}}), SchemaError);
}

TEST(Schema, RejectsDuplicateAdditionalFields)
{
  EXPECT_THROW(Schema("logs", {{"user", "TEXT"}, {"USER", "TEXT"}}), SchemaError);
}

TEST(Schema, SqlTextUsesQuotedIdentifiers)
{
  Schema schema("app_logs", {{"user_id", "TEXT"}});
  std::string create = schema.CreateTableSql();
  EXPECT_NE(create.find("CREATE TABLE IF NOT EXISTS \"app_logs\""), std::string::npos);
  EXPECT_NE(create.find("id INTEGER PRIMARY KEY AUTOINCREMENT"), std::string::npos);
  EXPECT_NE(create.find("\"user_id\" TEXT"), std::string::npos);

  std::string insert = schema.InsertSql();
  EXPECT_EQ(insert.find("INSERT INTO \"app_logs\""), 0u);
  size_t placeholders = 0;
  for (char c : insert)
  {
    if (c == '?') ++placeholders;
  }
  EXPECT_EQ(placeholders, schema.Columns().size());

  auto indexes = schema.CreateIndexSql();
  ASSERT_EQ(indexes.size(), 3u);
  EXPECT_NE(indexes[0].find("idx_app_logs_created_at"), std::string::npos);
}

class SchemaDbTest : public ::testing::Test
{
 protected:
  sqlog_test::TempDir dir_;
  std::string db_path_;
  sqlite3* db_ = nullptr;

  void SetUp() override
  {
    ASSERT_TRUE(dir_.Valid());
    db_path_ = dir_.File("schema.db");
    ASSERT_EQ(sqlite3_open(db_path_.c_str(), &db_), SQLITE_OK);
  }

  void TearDown() override { sqlite3_close(db_); }
};

TEST_F(SchemaDbTest, EnsureSchemaCreatesTableAndIndexes)
{
  Schema schema("logs", {{"user_id", "TEXT"}});
  schema.EnsureSchema(db_);

  auto columns = sqlog_test::QueryColumn(db_path_, "SELECT name FROM pragma_table_info('logs')");
  ASSERT_EQ(columns.size(), 16u);
  EXPECT_EQ(columns[0], "id");
  EXPECT_EQ(columns.back(), "user_id");

  EXPECT_EQ(sqlog_test::QueryInt(db_path_,
                                 "SELECT COUNT(*) FROM sqlite_master WHERE type='index' "
                                 "AND tbl_name='logs' AND name LIKE 'idx_logs_%'"),
            3);
}

TEST_F(SchemaDbTest, EnsureSchemaIsIdempotent)
{
  Schema schema("logs", {{"user_id", "TEXT"}});
  schema.EnsureSchema(db_);
  EXPECT_NO_THROW(schema.EnsureSchema(db_));
  EXPECT_NO_THROW(Schema("logs", {{"user_id", "TEXT"}}).EnsureSchema(db_));

  EXPECT_EQ(sqlog_test::QueryInt(db_path_, "SELECT COUNT(*) FROM pragma_table_info('logs')"), 16);
  EXPECT_EQ(sqlog_test::QueryInt(db_path_,
                                 "SELECT COUNT(*) FROM sqlite_master WHERE type='index' "
                                 "AND name LIKE 'idx_logs_%'"),
            3);
}

TEST_F(SchemaDbTest, ExistingTableMissingColumnIsRejected)
{
  Schema("logs", {}).EnsureSchema(db_);
  Schema wider("logs", {{"user_id", "TEXT"}});
  EXPECT_THROW(wider.EnsureSchema(db_), SchemaError);
}
