// wfgraph/project/catalog.hpp - Accessor and script catalog (YAML)
//
// A catalog describes one toolkit: the accessors of its locator, the scripts
// and the accessors each of them calls, plus the externally-supplied and
// published artifacts used by validation.
//
//   accessors:
//     get_weather:
//       category: inputs/weather
//       file: weather.epw
//       kind: weather
//       direction: read
//   external_inputs: [inputs/weather/*]
//   published_outputs: [outputs/plots/*]
//   scripts:
//     demand:
//       inputs: [get_weather]
//       outputs: [write_total_demand]
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "wfgraph/analysis/artifact_catalog.hpp"
#include "wfgraph/locator/locator_registry.hpp"
#include "wfgraph/trace/script.hpp"

namespace wfgraph
{

struct Catalog
{
  std::shared_ptr<const LocatorRegistry> registry = std::make_shared<LocatorRegistry>();
  ArtifactCatalog external_inputs;
  ArtifactCatalog published_outputs;

  /// In catalog order
  std::vector<std::unique_ptr<Script>> scripts;

  /// File the catalog was loaded from (empty when parsed from text)
  std::filesystem::path source;

  [[nodiscard]] const Script * find_script(std::string_view name) const;
  [[nodiscard]] std::vector<std::string> script_names() const;
};

/**
 * Result of loading a catalog.
 */
struct CatalogLoadResult
{
  /// Loaded catalog (only valid if success == true)
  Catalog catalog;

  bool success = false;
  std::string error;

  static CatalogLoadResult ok(Catalog c)
  {
    CatalogLoadResult r;
    r.catalog = std::move(c);
    r.success = true;
    return r;
  }

  static CatalogLoadResult fail(std::string msg)
  {
    CatalogLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Parse a catalog from YAML text.
 *
 * Rejects duplicate accessor or script names, scripts referring to unknown
 * accessors, and accessors listed under the wrong direction.
 */
[[nodiscard]] CatalogLoadResult parse_catalog(const std::string & yaml_text);

/**
 * Load a catalog file.
 */
[[nodiscard]] CatalogLoadResult load_catalog(const std::filesystem::path & path);

}  // namespace wfgraph
