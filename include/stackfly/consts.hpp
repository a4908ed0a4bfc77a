#pragma once
#include <cstdint>
#include <string_view>

namespace stackfly::consts {

// Directory and file names
inline constexpr std::string_view kConfigDir   = ".stackfly";
inline constexpr std::string_view kConfigFile  = "config";
inline constexpr std::string_view kCmdListFile = "stackfly.cmdlist";
inline constexpr std::string_view kManifestFile = "stackfly.manifest";

// Program name used in usage lines and diagnostics
inline constexpr std::string_view kProgram = "stackfly";

// ——— Command list cache ———
inline constexpr int kCmdListVersion = 1;

// ——— Config keys ———
inline constexpr std::string_view kAliasPrefix  = "alias.";
inline constexpr std::string_view kKeyManifest  = "manifest";
inline constexpr std::string_view kKeyCmdList   = "cmdlist";

} // namespace stackfly::consts
