#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "../log_record.hpp"
#include "../storage/schema.hpp"

namespace sqlog
{

// 单列的 SQLite 存储类取值
struct ColumnValue
{
  enum class Kind : uint8_t
  {
    Null,
    Integer,
    Real,
    Text
  };

  Kind kind = Kind::Null;
  int64_t integer = 0;
  double real = 0.0;
  std::string text;

  static ColumnValue Null() { return ColumnValue{}; }
  static ColumnValue Integer(int64_t v);
  static ColumnValue Real(double v);
  static ColumnValue Text(std::string v);
};

using Row = std::vector<ColumnValue>;

// LogRecord -> 按 Schema::Columns() 顺序排列的列值。只读记录，从不抛出序列化错误。
class RowFormatter
{
 public:
  explicit RowFormatter(const Schema& schema);

  Row Format(const LogRecord& record) const;

  // 以字符串替代的不可序列化叶子值累计数
  uint64_t SubstitutionCount() const { return substitutions_.load(std::memory_order_relaxed); }

 private:
  const Schema& schema_;
  mutable std::atomic<uint64_t> substitutions_{0};

  ColumnValue FormatAdditional(const std::string& name, const LogRecord& record) const;
  ColumnValue FormatValue(const Value& value) const;
  ColumnValue FormatExtra(const LogRecord& record) const;
  void CountSubstitutions(size_t n) const;
};

}  // namespace sqlog
