// wfgraph/driver/catalog_finder.hpp - Default catalog auto-detection
//
// Locates the catalogs shipped with wfgraph (share/wfgraph/catalogs).
//
#pragma once

#include <filesystem>
#include <optional>

namespace wfgraph
{

/**
 * Try to find the directory of shipped catalogs.
 *
 * Search order:
 * 1. Installed path (from cmake install, WFGRAPH_CATALOG_INSTALL_PATH)
 * 2. Relative to executable: <prefix>/share/wfgraph/catalogs/
 * 3. Development layout: <build>/../share/wfgraph/catalogs/
 *
 * @return Path to the catalog directory, or nullopt if not found
 */
[[nodiscard]] std::optional<std::filesystem::path> find_catalog_dir();

/**
 * The default catalog file (cea.yml) inside find_catalog_dir().
 */
[[nodiscard]] std::optional<std::filesystem::path> find_default_catalog();

inline constexpr const char * k_default_catalog_file_name = "cea.yml";

}  // namespace wfgraph
