// wfgraph/locator/locator.cpp - Scenario path resolution
#include "wfgraph/locator/locator.hpp"

#include <system_error>
#include <utility>

#include "wfgraph/basic/errors.hpp"

namespace wfgraph
{

ScenarioLocator::ScenarioLocator(
  std::shared_ptr<const LocatorRegistry> registry, std::filesystem::path scenario_root)
: registry_(std::move(registry)), scenario_root_(std::move(scenario_root))
{
}

std::filesystem::path ScenarioLocator::path(
  std::string_view accessor, const PlaceholderMap & placeholders)
{
  const Accessor & acc = registry_->resolve(accessor);
  const std::filesystem::path folder = scenario_root_ / acc.artifact.category;

  if (acc.is_write()) {
    std::error_code ec;
    std::filesystem::create_directories(folder, ec);
    if (ec) {
      throw Error("failed to create folder '" + folder.string() + "': " + ec.message());
    }
  }

  return folder / acc.artifact.expand(placeholders);
}

}  // namespace wfgraph
