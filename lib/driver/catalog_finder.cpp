// wfgraph/driver/catalog_finder.cpp - Default catalog auto-detection
//
#include "wfgraph/driver/catalog_finder.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace wfgraph
{

std::optional<fs::path> find_catalog_dir()
{
  // 1. Check installed path (from cmake install)
#ifdef WFGRAPH_CATALOG_INSTALL_PATH
  {
    fs::path installed = WFGRAPH_CATALOG_INSTALL_PATH;
    if (fs::is_directory(installed)) {
      return installed;
    }
  }
#endif

  // 2. Check relative to executable location
  // Typical layout:
  //   Installed: <prefix>/bin/wfgraph, <prefix>/share/wfgraph/catalogs/
  //   Development: <build>/wfgraph, <project>/share/wfgraph/catalogs/
  std::error_code ec;
  auto exe_path = fs::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return std::nullopt;
  }
  const auto bin_dir = exe_path.parent_path();

  for (const auto & candidate :
       {bin_dir / ".." / "share" / "wfgraph" / "catalogs",
        bin_dir / ".." / ".." / "share" / "wfgraph" / "catalogs"}) {
    if (fs::is_directory(candidate, ec)) {
      auto resolved = fs::canonical(candidate, ec);
      if (!ec) {
        return resolved;
      }
    }
  }

  return std::nullopt;
}

std::optional<fs::path> find_default_catalog()
{
  auto dir = find_catalog_dir();
  if (!dir) {
    return std::nullopt;
  }
  fs::path file = *dir / k_default_catalog_file_name;
  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) {
    return std::nullopt;
  }
  return file;
}

}  // namespace wfgraph
