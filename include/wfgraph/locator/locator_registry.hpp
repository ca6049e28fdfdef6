// wfgraph/locator/locator_registry.hpp - Accessor catalog
//
// Maps accessor names (get_weather, get_zone_geometry, ...) to the artifact
// they resolve and the direction of the access. Populated once from the
// catalog, then shared read-only by every tracing worker.
//
#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "wfgraph/model/artifact.hpp"

namespace wfgraph
{

// ============================================================================
// Accessor
// ============================================================================

/**
 * A registered accessor: one artifact, one direction.
 */
struct Accessor
{
  std::string name;
  Artifact artifact;
  Direction direction = Direction::Read;

  [[nodiscard]] bool is_read() const noexcept { return direction == Direction::Read; }
  [[nodiscard]] bool is_write() const noexcept { return direction == Direction::Write; }
};

// ============================================================================
// Locator Registry
// ============================================================================

class LocatorRegistry
{
public:
  LocatorRegistry() = default;

  // ===========================================================================
  // Registration
  // ===========================================================================

  /**
   * Register an accessor.
   *
   * @return true if registered, false if the name already exists
   */
  bool define(Accessor accessor);

  // ===========================================================================
  // Lookup
  // ===========================================================================

  /**
   * Resolve an accessor by name.
   *
   * @throws UnknownAccessor if the name is not registered
   */
  [[nodiscard]] const Accessor & resolve(std::string_view name) const;

  /**
   * Look up an accessor by name.
   *
   * @return Pointer to the accessor if found, nullptr otherwise
   */
  [[nodiscard]] const Accessor * lookup(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const { return lookup(name) != nullptr; }

  [[nodiscard]] size_t size() const noexcept { return accessors_.size(); }
  [[nodiscard]] bool empty() const noexcept { return accessors_.empty(); }

  /**
   * All accessors, sorted by name.
   */
  [[nodiscard]] std::vector<const Accessor *> sorted() const;

  /**
   * Accessors targeting the given artifact, sorted by name.
   */
  [[nodiscard]] std::vector<const Accessor *> accessors_for(const Artifact & artifact) const;

private:
  std::map<std::string, Accessor, std::less<>> accessors_;
};

}  // namespace wfgraph
