#include "stackfly/kinds.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace stackfly {

namespace {

const KindInfo &info(Kind kind) {
  const auto it = std::ranges::find(kKindCatalog, kind, &KindInfo::kind);
  if (it == kKindCatalog.end())
    throw std::runtime_error("kind missing from catalog");
  return *it;
}

} // namespace

std::optional<Kind> kind_from_key(std::string_view key) {
  const auto it = std::ranges::find(kKindCatalog, key, &KindInfo::key);
  if (it == kKindCatalog.end())
    return std::nullopt;
  return it->kind;
}

std::optional<Kind> kind_from_label(std::string_view label) {
  const auto it = std::ranges::find(kKindCatalog, label, &KindInfo::label);
  if (it == kKindCatalog.end())
    return std::nullopt;
  return it->kind;
}

Kind require_kind(std::string_view key, std::string_view owner) {
  if (auto kind = kind_from_key(key))
    return *kind;
  throw std::runtime_error("unknown command kind '" + std::string(key) + "' in '" +
                           std::string(owner) + "'");
}

std::string_view kind_label(Kind kind) { return info(kind).label; }

} // namespace stackfly
