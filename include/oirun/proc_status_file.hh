#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

// Returns contents of the field @p field_name from /proc/<pid>/status
// E.g. requesting "VmRSS" from file with line "VmRSS:  19096 kB" will return
// "19096 kB". Returns std::nullopt if there is no such field.
// Throws if the file cannot be read (e.g. the process is already gone).
std::optional<std::string> field_from_proc_status(pid_t pid, std::string_view field_name);

// Resident set size of @p pid in bytes, 0 for a process without memory (zombie)
uint64_t resident_set_size(pid_t pid);
