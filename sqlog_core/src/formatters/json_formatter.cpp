#include "sqlog/formatters/json_formatter.hpp"
#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

static size_t utf8_sequence_length(const unsigned char* p, size_t remaining) {
    unsigned char c = p[0];
    size_t len;
    uint32_t min_cp;
    uint32_t cp;
    if (c < 0x80) {
        return 1;
    } else if ((c & 0xE0) == 0xC0) {
        len = 2; min_cp = 0x80; cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
        len = 3; min_cp = 0x800; cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
        len = 4; min_cp = 0x10000; cp = c & 0x07;
    } else {
        return 0;
    }
    if (len > remaining) {
        return 0;
    }
    for (size_t i = 1; i < len; ++i) {
        if ((p[i] & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (p[i] & 0x3F);
    }
    // 过长编码、代理区、超出 Unicode 范围
    if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
        return 0;
    }
    return len;
}

namespace sqlog {

size_t JsonFormatter::EscapeJsonString(const char* src, size_t src_len, std::string& out) {
    const char* hex_digits = "0123456789ABCDEF";
    const auto* bytes = reinterpret_cast<const unsigned char*>(src);
    size_t invalid = 0;
    out.push_back('"');
    for (size_t i = 0; i < src_len;) {
        unsigned char c = bytes[i];
        switch (c) {
            case '"':
                out += "\\\"";
                ++i;
                break;
            case '\\':
                out += "\\\\";
                ++i;
                break;
            case '\n':
                out += "\\n";
                ++i;
                break;
            case '\r':
                out += "\\r";
                ++i;
                break;
            case '\t':
                out += "\\t";
                ++i;
                break;
            default:
                if (c <= 0x1F) {
                    out += "\\u00";
                    out.push_back(hex_digits[(c >> 4) & 0x0F]);
                    out.push_back(hex_digits[c & 0x0F]);
                    ++i;
                } else if (c < 0x80) {
                    out.push_back(static_cast<char>(c));
                    ++i;
                } else {
                    size_t n = utf8_sequence_length(bytes + i, src_len - i);
                    if (n == 0) {
                        // 非法字节以文本 \xHH 保留
                        out += "\\\\x";
                        out.push_back(hex_digits[(c >> 4) & 0x0F]);
                        out.push_back(hex_digits[c & 0x0F]);
                        ++invalid;
                        ++i;
                    } else {
                        out.append(src + i, n);
                        i += n;
                    }
                }
                break;
        }
    }
    out.push_back('"');
    return invalid > 0 ? 1 : 0;
}

size_t JsonFormatter::AppendDouble(double d, std::string& out) {
    if (std::isnan(d)) {
        out += "\"NaN\"";
        return 1;
    }
    if (std::isinf(d)) {
        out += d > 0 ? "\"Infinity\"" : "\"-Infinity\"";
        return 1;
    }
    // 取能精确读回的最短表示；无小数点/指数时补 ".0"，读回仍是浮点数
    char tmp[40];
    int n = std::snprintf(tmp, sizeof(tmp), "%.15g", d);
    if (n <= 0 || std::strtod(tmp, nullptr) != d) {
        n = std::snprintf(tmp, sizeof(tmp), "%.17g", d);
    }
    if (n <= 0) {
        return 0;
    }
    out.append(tmp, static_cast<size_t>(n));
    if (std::strpbrk(tmp, ".eE") == nullptr) {
        out += ".0";
    }
    return 0;
}

size_t JsonFormatter::AppendObject(const Value::Object& members, std::string& out) {
    size_t substitutions = 0;
    out.push_back('{');
    bool first = true;
    for (const auto& [key, member] : members) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        substitutions += EscapeJsonString(key.data(), key.size(), out);
        out.push_back(':');
        substitutions += Append(member, out);
    }
    out.push_back('}');
    return substitutions;
}

size_t JsonFormatter::Append(const Value& value, std::string& out) {
    switch (value.Type()) {
        case ValueType::Null:
            out += "null";
            return 0;
        case ValueType::Bool:
            out += value.AsBool() ? "true" : "false";
            return 0;
        case ValueType::Int: {
            char tmp[32];
            int n = std::snprintf(tmp, sizeof(tmp), "%" PRId64, value.AsInt());
            if (n > 0) {
                out.append(tmp, static_cast<size_t>(n));
            }
            return 0;
        }
        case ValueType::Double:
            return AppendDouble(value.AsDouble(), out);
        case ValueType::String: {
            const std::string& s = value.AsString();
            return EscapeJsonString(s.data(), s.size(), out);
        }
        case ValueType::Array: {
            size_t substitutions = 0;
            out.push_back('[');
            bool first = true;
            for (const auto& item : value.AsArray()) {
                if (!first) {
                    out.push_back(',');
                }
                first = false;
                substitutions += Append(item, out);
            }
            out.push_back(']');
            return substitutions;
        }
        case ValueType::Object:
            return AppendObject(value.AsObject(), out);
    }
    return 0;
}

std::string JsonFormatter::Serialize(const Value& value, size_t* substitutions) {
    std::string out;
    size_t n = Append(value, out);
    if (substitutions) {
        *substitutions = n;
    }
    return out;
}

std::string JsonFormatter::Serialize(const Fields& fields, size_t* substitutions) {
    std::string out;
    size_t n = AppendObject(fields, out);
    if (substitutions) {
        *substitutions = n;
    }
    return out;
}

std::string JsonFormatter::Serialize(const ExceptionInfo& info, size_t* substitutions) {
    Fields payload{
        {"type", info.type},
        {"message", info.message},
        {"stack_trace", info.stack_trace},
    };
    return Serialize(payload, substitutions);
}

} // namespace sqlog
