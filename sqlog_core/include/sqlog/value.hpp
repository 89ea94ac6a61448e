#pragma once
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace sqlog
{

enum class ValueType : uint8_t
{
  Null,
  Bool,
  Int,
  Double,
  String,
  Array,
  Object
};

// JSON 可序列化的值：extra 与附加字段共用。数组/对象不可变，拷贝时共享。
class Value
{
 public:
  using Array = std::vector<Value>;
  using Object = std::map<std::string, Value>;

  Value() = default;
  Value(std::nullptr_t) {}
  Value(bool b) : type_(ValueType::Bool), bool_(b) {}

  // 超出 int64 范围的无符号整数按十进制字符串保存，数值不变号
  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Value(T v) : type_(ValueType::Int)
  {
    if constexpr (std::is_unsigned_v<T>)
    {
      if (static_cast<uint64_t>(v) > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      {
        type_ = ValueType::String;
        string_ = std::to_string(v);
        return;
      }
    }
    int_ = static_cast<int64_t>(v);
  }

  template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
  Value(T v) : type_(ValueType::Double), double_(static_cast<double>(v))
  {
  }

  Value(const char* s);
  Value(std::string s);
  Value(Array items);
  Value(Object members);

  static Value MakeArray(std::initializer_list<Value> items);
  static Value MakeObject(std::initializer_list<std::pair<const std::string, Value>> members);

  ValueType Type() const { return type_; }
  bool IsNull() const { return type_ == ValueType::Null; }
  bool IsScalar() const { return type_ != ValueType::Array && type_ != ValueType::Object; }

  // 类型不匹配时抛出 std::logic_error
  bool AsBool() const;
  int64_t AsInt() const;
  double AsDouble() const;
  const std::string& AsString() const;
  const Array& AsArray() const;
  const Object& AsObject() const;

  bool operator==(const Value& other) const;
  bool operator!=(const Value& other) const { return !(*this == other); }

 private:
  ValueType type_ = ValueType::Null;
  bool bool_ = false;
  int64_t int_ = 0;
  double double_ = 0.0;
  std::string string_;
  std::shared_ptr<const Array> array_;
  std::shared_ptr<const Object> object_;
};

// 调用方在 emit 时提供的键值集合；键有序，保证序列化结果稳定
using Fields = std::map<std::string, Value>;

}  // namespace sqlog
