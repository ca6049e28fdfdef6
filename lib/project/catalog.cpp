// wfgraph/project/catalog.cpp - Accessor and script catalog (YAML)
//
#include "wfgraph/project/catalog.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <set>

namespace wfgraph
{

const Script * Catalog::find_script(std::string_view name) const
{
  for (const auto & s : scripts) {
    if (s->name() == name) {
      return s.get();
    }
  }
  return nullptr;
}

std::vector<std::string> Catalog::script_names() const
{
  std::vector<std::string> names;
  names.reserve(scripts.size());
  for (const auto & s : scripts) {
    names.push_back(s->name());
  }
  return names;
}

namespace
{

/// Parse one entry of the 'accessors' map
std::optional<Accessor> parse_accessor(
  const std::string & name, const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "accessor '" + name + "' must be a map";
    return std::nullopt;
  }
  for (const char * key : {"category", "file", "direction"}) {
    if (!node[key]) {
      error = "accessor '" + name + "' is missing '" + key + "'";
      return std::nullopt;
    }
  }

  Accessor acc;
  acc.name = name;
  acc.artifact.category = node["category"].as<std::string>();
  acc.artifact.name_template = node["file"].as<std::string>();

  const auto direction_text = node["direction"].as<std::string>();
  const auto direction = parse_direction(direction_text);
  if (!direction) {
    error = "accessor '" + name + "': invalid direction '" + direction_text +
            "' (must be 'read' or 'write')";
    return std::nullopt;
  }
  acc.direction = *direction;

  acc.artifact.kind = ArtifactKind::ComputedResult;
  if (node["kind"]) {
    const auto kind_text = node["kind"].as<std::string>();
    const auto kind = parse_artifact_kind(kind_text);
    if (!kind) {
      error = "accessor '" + name + "': unknown kind '" + kind_text + "'";
      return std::nullopt;
    }
    acc.artifact.kind = *kind;
  }

  return acc;
}

/// Read a list of strings; a missing node is an empty list
bool parse_string_list(
  const YAML::Node & node, const std::string & what, std::vector<std::string> & out,
  std::string & error)
{
  if (!node || node.IsNull()) {
    return true;
  }
  if (!node.IsSequence()) {
    error = what + " must be a list";
    return false;
  }
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return true;
}

/// Check that every accessor of a script list exists and has the expected direction
bool check_accessor_list(
  const LocatorRegistry & registry, const std::string & script,
  const std::vector<std::string> & names, Direction expected, std::string & error)
{
  for (const auto & name : names) {
    const Accessor * acc = registry.lookup(name);
    if (acc == nullptr) {
      error = "script '" + script + "' uses unknown accessor '" + name + "'";
      return false;
    }
    if (acc->direction != expected) {
      error = "script '" + script + "' lists " + std::string(to_string(acc->direction)) +
              " accessor '" + name + "' under " +
              (expected == Direction::Read ? "inputs" : "outputs");
      return false;
    }
  }
  return true;
}

CatalogLoadResult parse_root(const YAML::Node & root)
{
  if (!root.IsMap()) {
    return CatalogLoadResult::fail("catalog must be a map");
  }

  Catalog catalog;
  auto registry = std::make_shared<LocatorRegistry>();

  // Parse 'accessors' section
  if (root["accessors"]) {
    if (!root["accessors"].IsMap()) {
      return CatalogLoadResult::fail("accessors must be a map");
    }
    for (const auto & entry : root["accessors"]) {
      const auto name = entry.first.as<std::string>();
      std::string error;
      auto acc = parse_accessor(name, entry.second, error);
      if (!acc) {
        return CatalogLoadResult::fail(error);
      }
      if (!registry->define(std::move(*acc))) {
        return CatalogLoadResult::fail("duplicate accessor '" + name + "'");
      }
    }
  }

  // Parse 'external_inputs' / 'published_outputs'
  {
    std::vector<std::string> entries;
    std::string error;
    if (!parse_string_list(root["external_inputs"], "external_inputs", entries, error)) {
      return CatalogLoadResult::fail(error);
    }
    catalog.external_inputs = ArtifactCatalog(entries);

    entries.clear();
    if (!parse_string_list(root["published_outputs"], "published_outputs", entries, error)) {
      return CatalogLoadResult::fail(error);
    }
    catalog.published_outputs = ArtifactCatalog(entries);
  }

  // Parse 'scripts' section
  if (root["scripts"]) {
    if (!root["scripts"].IsMap()) {
      return CatalogLoadResult::fail("scripts must be a map");
    }
    std::set<std::string> seen;
    for (const auto & entry : root["scripts"]) {
      const auto name = entry.first.as<std::string>();
      const YAML::Node & node = entry.second;
      if (!seen.insert(name).second) {
        return CatalogLoadResult::fail("duplicate script '" + name + "'");
      }
      if (!node.IsNull() && !node.IsMap()) {
        return CatalogLoadResult::fail("script '" + name + "' must be a map");
      }

      std::vector<std::string> inputs;
      std::vector<std::string> outputs;
      std::string error;
      if (
        !parse_string_list(node["inputs"], name + ".inputs", inputs, error) ||
        !parse_string_list(node["outputs"], name + ".outputs", outputs, error) ||
        !check_accessor_list(*registry, name, inputs, Direction::Read, error) ||
        !check_accessor_list(*registry, name, outputs, Direction::Write, error)) {
        return CatalogLoadResult::fail(error);
      }

      catalog.scripts.push_back(
        std::make_unique<DeclaredScript>(name, std::move(inputs), std::move(outputs)));
    }
  }

  catalog.registry = std::move(registry);
  return CatalogLoadResult::ok(std::move(catalog));
}

}  // namespace

CatalogLoadResult parse_catalog(const std::string & yaml_text)
{
  try {
    return parse_root(YAML::Load(yaml_text));
  } catch (const YAML::Exception & e) {
    return CatalogLoadResult::fail("failed to parse catalog: " + std::string(e.what()));
  }
}

CatalogLoadResult load_catalog(const std::filesystem::path & path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(path)) {
    return CatalogLoadResult::fail("catalog file not found: " + path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception & e) {
    return CatalogLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  CatalogLoadResult result;
  try {
    result = parse_root(root);
  } catch (const YAML::Exception & e) {
    return CatalogLoadResult::fail(path.string() + ": " + std::string(e.what()));
  }
  if (!result.success) {
    result.error = path.string() + ": " + result.error;
    return result;
  }
  result.catalog.source = fs::absolute(path);
  return result;
}

}  // namespace wfgraph
