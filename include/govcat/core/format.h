#pragma once

// std::format when the standard library ships it, fmt (through spdlog) otherwise

#if GOVCAT_HAS_STD_FORMAT
#include <format>
namespace govcat {
using std::format;
} // namespace govcat
#else
#include <spdlog/fmt/fmt.h>
namespace govcat {
using fmt::format;
} // namespace govcat
#endif
