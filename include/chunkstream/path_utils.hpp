#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace cs {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Size of a regular file, or 0 when it cannot be queried.
std::uint64_t file_size_or_zero(const std::filesystem::path& p);

// Printable form of a delimiter for logs ("\n" -> "\\n").
std::string printable(std::string_view s);

}
