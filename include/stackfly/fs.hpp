#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace stackfly::fs {

// false only when nothing is at `p`; any other stat failure (EACCES, ELOOP, ...) throws.
bool exists(const std::filesystem::path& p);

std::string read_text(const std::filesystem::path& p);

// Write through "<p>.tmp" and rename over `p`, creating parent directories.
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

// Directory holding the running executable.
std::filesystem::path executable_dir();

} // namespace stackfly::fs
