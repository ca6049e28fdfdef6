// wfgraph/model/artifact.hpp - Artifact identifiers and access direction
//
// An Artifact names a location contract (directory + file name template).
// It never owns file content.
//
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace wfgraph
{

// ============================================================================
// Enumerations
// ============================================================================

enum class ArtifactKind : uint8_t {
  Weather,
  Gis,
  SpreadsheetArchetype,
  TabularProperty,
  ComputedResult,
  JsonMetadata,
};

/**
 * Whether invoking an accessor is an input or an output of the calling script.
 */
enum class Direction : uint8_t {
  Read,
  Write,
};

[[nodiscard]] std::string_view to_string(ArtifactKind kind) noexcept;
[[nodiscard]] std::string_view to_string(Direction direction) noexcept;

/// Parse "weather", "gis", "spreadsheet-archetype", ...
[[nodiscard]] std::optional<ArtifactKind> parse_artifact_kind(std::string_view text);

/// Parse "read" / "write" (also accepts "input" / "output")
[[nodiscard]] std::optional<Direction> parse_direction(std::string_view text);

// ============================================================================
// Placeholders
// ============================================================================

/// Placeholder values keyed by name without braces, e.g. {"BUILDING", "B01"}
using PlaceholderMap = std::map<std::string, std::string>;

inline constexpr const char * k_building_placeholder = "BUILDING";

/**
 * Replace every `{NAME}` whose NAME is in `values`. Unknown placeholders and
 * unbalanced braces are kept verbatim.
 */
[[nodiscard]] std::string expand_placeholders(
  std::string_view name_template, const PlaceholderMap & values);

// ============================================================================
// Artifact
// ============================================================================

struct Artifact
{
  /// Directory/namespace, e.g. "inputs/building-geometry"
  std::string category;

  /// File name, possibly templated, e.g. "{BUILDING}_geometry.csv"
  std::string name_template;

  ArtifactKind kind = ArtifactKind::ComputedResult;

  /// Identity key: "category/name_template"
  [[nodiscard]] std::string key() const { return category + "/" + name_template; }

  [[nodiscard]] bool is_templated() const noexcept
  {
    return name_template.find('{') != std::string::npos;
  }

  [[nodiscard]] std::string expand(const PlaceholderMap & values) const
  {
    return expand_placeholders(name_template, values);
  }

  /// Stable ordering: category, then name. Kind is not part of the identity.
  friend bool operator<(const Artifact & a, const Artifact & b)
  {
    return std::tie(a.category, a.name_template) < std::tie(b.category, b.name_template);
  }

  friend bool operator==(const Artifact & a, const Artifact & b)
  {
    return a.category == b.category && a.name_template == b.name_template;
  }

  friend bool operator!=(const Artifact & a, const Artifact & b) { return !(a == b); }
};

}  // namespace wfgraph
