#include "sqlog/formatters/row_formatter.hpp"

#include <cmath>

#include "sqlog/formatters/json_formatter.hpp"
#include "sqlog/timestamp.hpp"

namespace sqlog
{

ColumnValue ColumnValue::Integer(int64_t v)
{
  ColumnValue cv;
  cv.kind = Kind::Integer;
  cv.integer = v;
  return cv;
}

ColumnValue ColumnValue::Real(double v)
{
  ColumnValue cv;
  cv.kind = Kind::Real;
  cv.real = v;
  return cv;
}

ColumnValue ColumnValue::Text(std::string v)
{
  ColumnValue cv;
  cv.kind = Kind::Text;
  cv.text = std::move(v);
  return cv;
}

namespace
{

ColumnValue TextOrNull(const std::string& s)
{
  return s.empty() ? ColumnValue::Null() : ColumnValue::Text(s);
}

}  // namespace

RowFormatter::RowFormatter(const Schema& schema) : schema_(schema) {}

void RowFormatter::CountSubstitutions(size_t n) const
{
  if (n > 0)
  {
    substitutions_.fetch_add(n, std::memory_order_relaxed);
  }
}

Row RowFormatter::Format(const LogRecord& record) const
{
  Row row;
  row.reserve(schema_.Columns().size());

  for (const auto& col : schema_.Columns())
  {
    switch (col.column)
    {
      case Column::CreatedAt:
        row.push_back(ColumnValue::Text(iso_timestamp(record.created_at_ns)));
        break;
      case Column::Level:
        row.push_back(ColumnValue::Integer(to_int(record.level)));
        break;
      case Column::LevelName:
        row.push_back(ColumnValue::Text(record.level_name.empty()
                                            ? std::string(to_string(record.level))
                                            : record.level_name));
        break;
      case Column::LoggerName:
        row.push_back(ColumnValue::Text(record.logger_name));
        break;
      case Column::Message:
        row.push_back(ColumnValue::Text(record.message));
        break;
      case Column::FunctionName:
        row.push_back(TextOrNull(record.function_name));
        break;
      case Column::FileName:
        row.push_back(TextOrNull(record.file_path));
        break;
      case Column::LineNumber:
        row.push_back(record.line > 0 ? ColumnValue::Integer(record.line) : ColumnValue::Null());
        break;
      case Column::ProcessId:
        row.push_back(ColumnValue::Integer(record.process_id));
        break;
      case Column::ProcessName:
        row.push_back(TextOrNull(record.process_name));
        break;
      case Column::ThreadId:
        row.push_back(ColumnValue::Integer(record.thread_id));
        break;
      case Column::ThreadName:
        row.push_back(TextOrNull(record.thread_name));
        break;
      case Column::Exception:
        if (record.exception)
        {
          size_t n = 0;
          row.push_back(ColumnValue::Text(JsonFormatter::Serialize(*record.exception, &n)));
          CountSubstitutions(n);
        }
        else
        {
          row.push_back(ColumnValue::Null());
        }
        break;
      case Column::Extra:
        row.push_back(FormatExtra(record));
        break;
      case Column::Additional:
        row.push_back(FormatAdditional(col.name, record));
        break;
    }
  }
  return row;
}

ColumnValue RowFormatter::FormatExtra(const LogRecord& record) const
{
  if (record.extra.empty())
  {
    return ColumnValue::Null();
  }

  // extra 中被附加列消费的键不再重复写入 extra
  bool consumed = false;
  for (const auto& field : schema_.AdditionalFields())
  {
    if (record.additional.count(field.name) == 0 && record.extra.count(field.name) > 0)
    {
      consumed = true;
      break;
    }
  }

  size_t n = 0;
  std::string json;
  if (!consumed)
  {
    json = JsonFormatter::Serialize(record.extra, &n);
  }
  else
  {
    Fields remaining;
    for (const auto& [key, value] : record.extra)
    {
      if (!schema_.HasAdditionalField(key) || record.additional.count(key) > 0)
      {
        remaining.emplace(key, value);
      }
    }
    if (remaining.empty())
    {
      return ColumnValue::Null();
    }
    json = JsonFormatter::Serialize(remaining, &n);
  }
  CountSubstitutions(n);
  return ColumnValue::Text(std::move(json));
}

ColumnValue RowFormatter::FormatAdditional(const std::string& name, const LogRecord& record) const
{
  auto it = record.additional.find(name);
  if (it != record.additional.end())
  {
    return FormatValue(it->second);
  }
  it = record.extra.find(name);
  if (it != record.extra.end())
  {
    return FormatValue(it->second);
  }
  return ColumnValue::Null();
}

ColumnValue RowFormatter::FormatValue(const Value& value) const
{
  switch (value.Type())
  {
    case ValueType::Null:
      return ColumnValue::Null();
    case ValueType::Bool:
      return ColumnValue::Integer(value.AsBool() ? 1 : 0);
    case ValueType::Int:
      return ColumnValue::Integer(value.AsInt());
    case ValueType::Double:
      if (!std::isfinite(value.AsDouble()))
      {
        size_t n = 0;
        std::string json = JsonFormatter::Serialize(value, &n);
        CountSubstitutions(n);
        // 去掉 JSON 字符串引号，落库为纯文本
        return ColumnValue::Text(json.substr(1, json.size() - 2));
      }
      return ColumnValue::Real(value.AsDouble());
    case ValueType::String:
      return ColumnValue::Text(value.AsString());
    case ValueType::Array:
    case ValueType::Object:
    {
      size_t n = 0;
      std::string json = JsonFormatter::Serialize(value, &n);
      CountSubstitutions(n);
      return ColumnValue::Text(std::move(json));
    }
  }
  return ColumnValue::Null();
}

}  // namespace sqlog
