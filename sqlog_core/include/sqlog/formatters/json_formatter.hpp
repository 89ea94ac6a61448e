#pragma once
#include <cstddef>
#include <string>

#include "../log_record.hpp"
#include "../value.hpp"

namespace sqlog {

// 规范化 JSON：对象键有序、无空白。无法表示的叶子值（非有限浮点数、非法 UTF-8）
// 替换为字符串，不会整体失败；substitutions 返回被替换的叶子数。
class JsonFormatter {
public:
    static std::string Serialize(const Value& value, size_t* substitutions = nullptr);
    static std::string Serialize(const Fields& fields, size_t* substitutions = nullptr);

    // 固定三段结构 {"message","stack_trace","type"}
    static std::string Serialize(const ExceptionInfo& info, size_t* substitutions = nullptr);

private:
    static size_t Append(const Value& value, std::string& out);
    static size_t AppendObject(const Value::Object& members, std::string& out);
    static size_t AppendDouble(double d, std::string& out);
    static size_t EscapeJsonString(const char* src, size_t src_len, std::string& out);
};

} // namespace sqlog
