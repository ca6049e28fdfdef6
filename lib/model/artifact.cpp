// wfgraph/model/artifact.cpp - Artifact helpers
#include "wfgraph/model/artifact.hpp"

#include <array>
#include <utility>

namespace wfgraph
{

namespace
{

constexpr std::array<std::pair<ArtifactKind, std::string_view>, 6> k_kind_names = {{
  {ArtifactKind::Weather, "weather"},
  {ArtifactKind::Gis, "gis"},
  {ArtifactKind::SpreadsheetArchetype, "spreadsheet-archetype"},
  {ArtifactKind::TabularProperty, "tabular-property"},
  {ArtifactKind::ComputedResult, "computed-result"},
  {ArtifactKind::JsonMetadata, "json-metadata"},
}};

}  // namespace

std::string_view to_string(ArtifactKind kind) noexcept
{
  for (const auto & [k, name] : k_kind_names) {
    if (k == kind) {
      return name;
    }
  }
  return "computed-result";
}

std::string_view to_string(Direction direction) noexcept
{
  return direction == Direction::Read ? "read" : "write";
}

std::optional<ArtifactKind> parse_artifact_kind(std::string_view text)
{
  for (const auto & [k, name] : k_kind_names) {
    if (name == text) {
      return k;
    }
  }
  return std::nullopt;
}

std::optional<Direction> parse_direction(std::string_view text)
{
  if (text == "read" || text == "input") {
    return Direction::Read;
  }
  if (text == "write" || text == "output") {
    return Direction::Write;
  }
  return std::nullopt;
}

std::string expand_placeholders(std::string_view name_template, const PlaceholderMap & values)
{
  std::string out;
  out.reserve(name_template.size());

  size_t i = 0;
  while (i < name_template.size()) {
    const char c = name_template[i];
    if (c != '{') {
      out.push_back(c);
      ++i;
      continue;
    }

    const size_t close = name_template.find('}', i + 1);
    if (close == std::string_view::npos) {
      // Unbalanced: copy the rest verbatim
      out.append(name_template.substr(i));
      break;
    }

    const std::string key(name_template.substr(i + 1, close - i - 1));
    auto it = values.find(key);
    if (it != values.end()) {
      out += it->second;
    } else {
      out.append(name_template.substr(i, close - i + 1));
    }
    i = close + 1;
  }

  return out;
}

}  // namespace wfgraph
