#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace aasx_kg {

// Language-tagged alternatives in source order: (language, text).
using LangStrings = std::vector<std::pair<std::string, std::string>>;

// ---------------------------------------------------------------------------
// DescriptionValue — a description as found in the source:
//   std::monostate  absent
//   std::string     bare string
//   LangStrings     language code -> text
// ---------------------------------------------------------------------------
using DescriptionValue = std::variant<std::monostate, std::string, LangStrings>;

/// Pick one human-readable string. A bare string is returned as-is; for
/// language alternatives the "en" entry wins (case-insensitive, so "EN"
/// matches), otherwise the first entry in source order; absent gives "".
[[nodiscard]] std::string ResolveDescription(const DescriptionValue& value);

} // namespace aasx_kg
