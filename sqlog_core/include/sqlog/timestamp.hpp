#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace sqlog
{

uint64_t wall_clock_now_ns();

// "YYYY-MM-DDTHH:MM:SS.ffffff", local time; returns length written (excluding '\0')
size_t format_iso_timestamp(uint64_t wall_ns, char* buf, size_t buf_size);
std::string iso_timestamp(uint64_t wall_ns);

}  // namespace sqlog
