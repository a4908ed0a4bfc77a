#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace stackfly {

// Command categories, in display order.
enum class Kind : std::uint8_t { Repo, Stack, Patch, Worktree, Alias };

struct KindInfo {
  Kind kind;
  std::string_view key;   // as written by command declarations ("repo", "wc", ...)
  std::string_view label; // as shown in listings
};

inline constexpr std::array<KindInfo, 5> kKindCatalog = {{
    {.kind = Kind::Repo, .key = "repo", .label = "Repository commands"},
    {.kind = Kind::Stack, .key = "stack", .label = "Stack (branch) commands"},
    {.kind = Kind::Patch, .key = "patch", .label = "Patch commands"},
    {.kind = Kind::Worktree, .key = "wc", .label = "Index/worktree commands"},
    {.kind = Kind::Alias, .key = "alias", .label = "Alias commands"},
}};

// Lookups by declaration key or display label; nullopt if not in the catalog.
std::optional<Kind> kind_from_key(std::string_view key);
std::optional<Kind> kind_from_label(std::string_view label);

// Like kind_from_key, but throws std::runtime_error naming `owner` on failure.
Kind require_kind(std::string_view key, std::string_view owner);

std::string_view kind_label(Kind kind);

} // namespace stackfly
