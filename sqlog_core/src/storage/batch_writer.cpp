#include "sqlog/storage/batch_writer.hpp"

#include <vector>

#include "sqlog/errors.hpp"

namespace sqlog
{

namespace
{

std::string ErrorText(sqlite3* db, int rc)
{
  const char* msg = db ? sqlite3_errmsg(db) : nullptr;
  return msg ? msg : sqlite3_errstr(rc);
}

}  // namespace

BatchWriter::BatchWriter(const Schema& schema, ConnectionProvider& provider)
    : schema_(schema), provider_(provider), formatter_(schema), insert_sql_(schema.InsertSql())
{
}

int BatchWriter::BindRow(sqlite3_stmt* stmt, const Row& row)
{
  for (size_t i = 0; i < row.size(); ++i)
  {
    const ColumnValue& cv = row[i];
    int index = static_cast<int>(i) + 1;
    int rc = SQLITE_OK;
    switch (cv.kind)
    {
      case ColumnValue::Kind::Null:
        rc = sqlite3_bind_null(stmt, index);
        break;
      case ColumnValue::Kind::Integer:
        rc = sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(cv.integer));
        break;
      case ColumnValue::Kind::Real:
        rc = sqlite3_bind_double(stmt, index, cv.real);
        break;
      case ColumnValue::Kind::Text:
        rc = sqlite3_bind_text(stmt, index, cv.text.data(), static_cast<int>(cv.text.size()),
                               SQLITE_TRANSIENT);
        break;
    }
    if (rc != SQLITE_OK)
    {
      return rc;
    }
  }
  return SQLITE_OK;
}

void BatchWriter::Flush(Batch batch)
{
  if (batch.Empty())
  {
    return;
  }

  const size_t batch_size = batch.Size();

  // 先在锁外完成序列化，连接只在事务期间持有
  std::vector<Row> rows;
  rows.reserve(batch_size);
  for (const auto& record : batch)
  {
    rows.push_back(formatter_.Format(record));
  }

  ConnectionProvider::Lease lease = provider_.Acquire();
  sqlite3* db = lease.Handle();

  auto fail = [&](const char* stage, int rc, sqlite3_stmt* stmt)
  {
    std::string what = std::string(stage) + " failed for table '" + schema_.TableName() +
                       "': " + ErrorText(db, rc);
    if (stmt)
    {
      sqlite3_reset(stmt);
    }
    if (!sqlite3_get_autocommit(db))
    {
      char* err_msg = nullptr;
      int rollback_rc = sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, &err_msg);
      if (rollback_rc != SQLITE_OK)
      {
        what += " (rollback failed: ";
        what += err_msg ? err_msg : sqlite3_errstr(rollback_rc);
        what += ")";
      }
      sqlite3_free(err_msg);
    }
    throw FlushError(what, rc, batch_size);
  };

  int rc = sqlite3_exec(db, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK)
  {
    fail("BEGIN", rc, nullptr);
  }

  sqlite3_stmt* stmt = nullptr;
  rc = lease.Get().PrepareCached(insert_sql_, &stmt);
  if (rc != SQLITE_OK)
  {
    fail("prepare INSERT", rc, nullptr);
  }

  for (const auto& row : rows)
  {
    rc = BindRow(stmt, row);
    if (rc != SQLITE_OK)
    {
      fail("bind", rc, stmt);
    }
    rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE)
    {
      fail("INSERT", rc, stmt);
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
  }

  rc = sqlite3_exec(db, "COMMIT", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK)
  {
    fail("COMMIT", rc, nullptr);
  }

  rows_written_.fetch_add(batch_size, std::memory_order_relaxed);
  batches_written_.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace sqlog
