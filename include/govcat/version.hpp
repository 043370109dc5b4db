#pragma once

#ifndef GOVCAT_VERSION_STRING
#define GOVCAT_VERSION_STRING "1.4.0"
#endif

namespace govcat {
inline constexpr const char* kVersion = GOVCAT_VERSION_STRING;
// Bumped whenever the tool table changes shape
inline constexpr const char* kRegistryVersion = "2025-08-27";
// On-disk entry document schema
inline constexpr const char* kSchemaVersion = "2";
} // namespace govcat
