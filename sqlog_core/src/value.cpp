#include "sqlog/value.hpp"

#include <stdexcept>

namespace sqlog
{

namespace
{

[[noreturn]] void ThrowTypeMismatch(const char* wanted)
{
  throw std::logic_error(std::string("sqlog::Value is not ") + wanted);
}

}  // namespace

Value::Value(const char* s) : type_(ValueType::String), string_(s ? s : "") {}

Value::Value(std::string s) : type_(ValueType::String), string_(std::move(s)) {}

Value::Value(Array items)
    : type_(ValueType::Array), array_(std::make_shared<const Array>(std::move(items)))
{
}

Value::Value(Object members)
    : type_(ValueType::Object), object_(std::make_shared<const Object>(std::move(members)))
{
}

Value Value::MakeArray(std::initializer_list<Value> items) { return Value(Array(items)); }

Value Value::MakeObject(std::initializer_list<std::pair<const std::string, Value>> members)
{
  return Value(Object(members));
}

bool Value::AsBool() const
{
  if (type_ != ValueType::Bool) ThrowTypeMismatch("a bool");
  return bool_;
}

int64_t Value::AsInt() const
{
  if (type_ != ValueType::Int) ThrowTypeMismatch("an integer");
  return int_;
}

double Value::AsDouble() const
{
  if (type_ == ValueType::Int) return static_cast<double>(int_);
  if (type_ != ValueType::Double) ThrowTypeMismatch("a number");
  return double_;
}

const std::string& Value::AsString() const
{
  if (type_ != ValueType::String) ThrowTypeMismatch("a string");
  return string_;
}

const Value::Array& Value::AsArray() const
{
  if (type_ != ValueType::Array) ThrowTypeMismatch("an array");
  return *array_;
}

const Value::Object& Value::AsObject() const
{
  if (type_ != ValueType::Object) ThrowTypeMismatch("an object");
  return *object_;
}

bool Value::operator==(const Value& other) const
{
  if (type_ != other.type_) return false;
  switch (type_)
  {
    case ValueType::Null:
      return true;
    case ValueType::Bool:
      return bool_ == other.bool_;
    case ValueType::Int:
      return int_ == other.int_;
    case ValueType::Double:
      return double_ == other.double_;
    case ValueType::String:
      return string_ == other.string_;
    case ValueType::Array:
      return array_ == other.array_ || *array_ == *other.array_;
    case ValueType::Object:
      return object_ == other.object_ || *object_ == *other.object_;
  }
  return false;
}

}  // namespace sqlog
