#pragma once
#include <cstdint>

namespace sqlog {

struct SourceLocation {
    const char* file_path;
    const char* function_name;
    uint32_t    line;
};

#if __cplusplus >= 202002L && __has_include(<source_location>)
    #include <source_location>
    #define SQLOG_HAS_SOURCE_LOCATION 1
    #define SQLOG_CURRENT_LOCATION() \
        ::sqlog::SourceLocation { \
            std::source_location::current().file_name(), \
            std::source_location::current().function_name(), \
            std::source_location::current().line() \
        }
#else
    #define SQLOG_HAS_SOURCE_LOCATION 0
    #define SQLOG_CURRENT_LOCATION() \
        ::sqlog::SourceLocation { \
            __FILE__, \
            __func__, \
            static_cast<uint32_t>(__LINE__) \
        }
#endif

} // namespace sqlog
