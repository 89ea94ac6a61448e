#include "sqlog/storage/schema.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <unordered_set>

#include "sqlog/errors.hpp"

namespace sqlog
{

namespace
{

struct ReservedColumn
{
  Column column;
  const char* name;
  const char* type;
};

constexpr ReservedColumn kReservedColumns[] = {
    {Column::CreatedAt, "created_at", "TEXT NOT NULL"},
    {Column::Level, "level", "INTEGER NOT NULL"},
    {Column::LevelName, "level_name", "TEXT NOT NULL"},
    {Column::LoggerName, "logger_name", "TEXT NOT NULL"},
    {Column::Message, "message", "TEXT NOT NULL"},
    {Column::FunctionName, "function_name", "TEXT"},
    {Column::FileName, "filename", "TEXT"},
    {Column::LineNumber, "line_number", "INTEGER"},
    {Column::ProcessId, "process_id", "INTEGER"},
    {Column::ProcessName, "process_name", "TEXT"},
    {Column::ThreadId, "thread_id", "INTEGER"},
    {Column::ThreadName, "thread_name", "TEXT"},
    {Column::Exception, "exception_info", "TEXT"},
    {Column::Extra, "extra", "TEXT"},
};

// 被索引的列：按级别、时间、logger 过滤是最常见的查询
constexpr const char* kIndexedColumns[] = {"created_at", "level", "logger_name"};

std::string ToLower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string Quote(const std::string& identifier) { return "\"" + identifier + "\""; }

bool IsValidType(std::string_view type)
{
  for (char c : type)
  {
    unsigned char u = static_cast<unsigned char>(c);
    if (!std::isalnum(u) && c != ' ' && c != '(' && c != ')' && c != ',')
    {
      return false;
    }
  }
  return true;
}

void ExecOrThrow(sqlite3* db, const std::string& sql, const char* what)
{
  char* err_msg = nullptr;
  int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK)
  {
    std::string detail = err_msg ? err_msg : sqlite3_errstr(rc);
    sqlite3_free(err_msg);
    throw SchemaError(std::string(what) + ": " + detail);
  }
}

}  // namespace

bool IsReservedColumn(std::string_view name)
{
  std::string lower = ToLower(name);
  if (lower == "id") return true;
  for (const auto& col : kReservedColumns)
  {
    if (lower == col.name) return true;
  }
  return false;
}

bool IsValidIdentifier(std::string_view name)
{
  if (name.empty()) return false;
  unsigned char first = static_cast<unsigned char>(name.front());
  if (!std::isalpha(first) && first != '_') return false;
  for (char c : name)
  {
    unsigned char u = static_cast<unsigned char>(c);
    if (!std::isalnum(u) && c != '_') return false;
  }
  return true;
}

Schema::Schema(std::string table_name, std::vector<AdditionalField> additional_fields)
    : table_name_(std::move(table_name)), additional_fields_(std::move(additional_fields))
{
  for (auto& field : additional_fields_)
  {
    if (field.type.empty())
    {
      field.type = "TEXT";
    }
  }
  Validate();

  columns_.reserve(std::size(kReservedColumns) + additional_fields_.size());
  for (const auto& col : kReservedColumns)
  {
    columns_.push_back(ColumnSpec{col.column, col.name, col.type});
  }
  for (const auto& field : additional_fields_)
  {
    columns_.push_back(ColumnSpec{Column::Additional, field.name, field.type});
  }
}

void Schema::Validate() const
{
  if (!IsValidIdentifier(table_name_))
  {
    throw SchemaError("invalid table name '" + table_name_ + "'");
  }

  std::unordered_set<std::string> seen;
  for (const auto& field : additional_fields_)
  {
    if (!IsValidIdentifier(field.name))
    {
      throw SchemaError("invalid additional field name '" + field.name + "'");
    }
    if (IsReservedColumn(field.name))
    {
      throw SchemaError("additional field '" + field.name + "' collides with a reserved column");
    }
    if (!seen.insert(ToLower(field.name)).second)
    {
      throw SchemaError("additional field '" + field.name + "' declared twice");
    }
    if (!IsValidType(field.type))
    {
      throw SchemaError("invalid type '" + field.type + "' for additional field '" + field.name +
                        "'");
    }
  }
}

bool Schema::HasAdditionalField(std::string_view name) const
{
  for (const auto& field : additional_fields_)
  {
    if (field.name == name) return true;
  }
  return false;
}

std::string Schema::CreateTableSql() const
{
  std::string sql = "CREATE TABLE IF NOT EXISTS " + Quote(table_name_) +
                    " (id INTEGER PRIMARY KEY AUTOINCREMENT";
  for (const auto& col : columns_)
  {
    sql += ", " + Quote(col.name) + " " + col.type;
  }
  sql += ")";
  return sql;
}

std::vector<std::string> Schema::CreateIndexSql() const
{
  std::vector<std::string> statements;
  for (const char* column : kIndexedColumns)
  {
    statements.push_back("CREATE INDEX IF NOT EXISTS " +
                         Quote("idx_" + table_name_ + "_" + column) + " ON " +
                         Quote(table_name_) + " (" + Quote(column) + ")");
  }
  return statements;
}

std::string Schema::InsertSql() const
{
  std::string names;
  std::string placeholders;
  for (size_t i = 0; i < columns_.size(); ++i)
  {
    if (i > 0)
    {
      names += ", ";
      placeholders += ", ";
    }
    names += Quote(columns_[i].name);
    placeholders += "?";
  }
  return "INSERT INTO " + Quote(table_name_) + " (" + names + ") VALUES (" + placeholders + ")";
}

void Schema::EnsureSchema(sqlite3* db) const
{
  ExecOrThrow(db, "BEGIN IMMEDIATE", "failed to begin schema transaction");
  try
  {
    ExecOrThrow(db, CreateTableSql(), "failed to create table");
    VerifyExistingTable(db);
    for (const auto& sql : CreateIndexSql())
    {
      ExecOrThrow(db, sql, "failed to create index");
    }
    ExecOrThrow(db, "COMMIT", "failed to commit schema");
  }
  catch (const SchemaError&)
  {
    sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr);
    throw;
  }
}

void Schema::VerifyExistingTable(sqlite3* db) const
{
  std::string sql = "PRAGMA table_info(" + Quote(table_name_) + ")";
  sqlite3_stmt* stmt = nullptr;
  int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
  if (rc != SQLITE_OK)
  {
    throw SchemaError("failed to inspect table '" + table_name_ + "': " + sqlite3_errmsg(db));
  }

  std::unordered_set<std::string> existing;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
  {
    const unsigned char* name = sqlite3_column_text(stmt, 1);
    if (name)
    {
      existing.insert(ToLower(reinterpret_cast<const char*>(name)));
    }
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE)
  {
    throw SchemaError("failed to inspect table '" + table_name_ + "': " + sqlite3_errstr(rc));
  }

  for (const auto& col : columns_)
  {
    if (existing.count(ToLower(col.name)) == 0)
    {
      throw SchemaError("table '" + table_name_ + "' exists without column '" + col.name + "'");
    }
  }
}

}  // namespace sqlog
