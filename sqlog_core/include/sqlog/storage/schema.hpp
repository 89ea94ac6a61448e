#pragma once
#include <sqlite3.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlog
{

// 调用方声明的附加列；type 为空时按 TEXT 建列
struct AdditionalField
{
  std::string name;
  std::string type;

  AdditionalField() = default;
  AdditionalField(std::string n, std::string t = "TEXT") : name(std::move(n)), type(std::move(t)) {}
};

enum class Column : uint8_t
{
  CreatedAt,
  Level,
  LevelName,
  LoggerName,
  Message,
  FunctionName,
  FileName,
  LineNumber,
  ProcessId,
  ProcessName,
  ThreadId,
  ThreadName,
  Exception,
  Extra,
  Additional
};

struct ColumnSpec
{
  Column column;
  std::string name;
  std::string type;  // 含约束，例如 "INTEGER NOT NULL"
};

// 保留列名（含 id），大小写不敏感
bool IsReservedColumn(std::string_view name);
bool IsValidIdentifier(std::string_view name);

class Schema
{
 public:
  // 校验失败抛 SchemaError
  Schema(std::string table_name, std::vector<AdditionalField> additional_fields);

  const std::string& TableName() const { return table_name_; }

  // 插入列顺序：保留列在前，附加列按声明顺序在后（不含自增 id）
  const std::vector<ColumnSpec>& Columns() const { return columns_; }
  const std::vector<AdditionalField>& AdditionalFields() const { return additional_fields_; }
  bool HasAdditionalField(std::string_view name) const;

  std::string CreateTableSql() const;
  std::vector<std::string> CreateIndexSql() const;
  std::string InsertSql() const;

  // 幂等：建表、校验已有表结构、建索引
  void EnsureSchema(sqlite3* db) const;

 private:
  std::string table_name_;
  std::vector<AdditionalField> additional_fields_;
  std::vector<ColumnSpec> columns_;

  void Validate() const;
  void VerifyExistingTable(sqlite3* db) const;
};

}  // namespace sqlog
