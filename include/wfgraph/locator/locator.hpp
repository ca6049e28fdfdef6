// wfgraph/locator/locator.hpp - Path resolution interface used by scripts
//
// Scripts never build paths themselves; they ask a Locator for the path behind
// an accessor name. The scenario locator resolves real paths, the tracing
// locator (trace/tracing_locator.hpp) records the call instead.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include "wfgraph/locator/locator_registry.hpp"
#include "wfgraph/model/artifact.hpp"

namespace wfgraph
{

class Locator
{
public:
  virtual ~Locator() = default;

  /**
   * Resolve the path behind an accessor.
   *
   * @param accessor Registered accessor name
   * @param placeholders Values for templated names ({BUILDING}, ...)
   * @throws UnknownAccessor if the accessor is not registered
   */
  [[nodiscard]] virtual std::filesystem::path path(
    std::string_view accessor, const PlaceholderMap & placeholders) = 0;

  [[nodiscard]] std::filesystem::path path(std::string_view accessor)
  {
    return path(accessor, PlaceholderMap{});
  }

  /// Convenience for the common per-building case
  [[nodiscard]] std::filesystem::path building_path(
    std::string_view accessor, std::string_view building)
  {
    return path(accessor, PlaceholderMap{{k_building_placeholder, std::string(building)}});
  }
};

/**
 * Resolves accessors below a scenario directory.
 *
 * Write accessors get their parent folder created on resolution, so a script
 * can open the returned path for writing straight away.
 */
class ScenarioLocator : public Locator
{
public:
  ScenarioLocator(
    std::shared_ptr<const LocatorRegistry> registry, std::filesystem::path scenario_root);

  using Locator::path;

  [[nodiscard]] std::filesystem::path path(
    std::string_view accessor, const PlaceholderMap & placeholders) override;

  [[nodiscard]] const std::filesystem::path & scenario_root() const noexcept
  {
    return scenario_root_;
  }

private:
  std::shared_ptr<const LocatorRegistry> registry_;
  std::filesystem::path scenario_root_;
};

}  // namespace wfgraph
