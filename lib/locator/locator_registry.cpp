// wfgraph/locator/locator_registry.cpp - Accessor catalog implementation
#include "wfgraph/locator/locator_registry.hpp"

#include <utility>

#include "wfgraph/basic/errors.hpp"

namespace wfgraph
{

bool LocatorRegistry::define(Accessor accessor)
{
  std::string key = accessor.name;
  auto [it, inserted] = accessors_.emplace(std::move(key), std::move(accessor));
  return inserted;
}

const Accessor & LocatorRegistry::resolve(std::string_view name) const
{
  const Accessor * accessor = lookup(name);
  if (accessor == nullptr) {
    throw UnknownAccessor(std::string(name));
  }
  return *accessor;
}

const Accessor * LocatorRegistry::lookup(std::string_view name) const
{
  auto it = accessors_.find(name);
  return it != accessors_.end() ? &it->second : nullptr;
}

std::vector<const Accessor *> LocatorRegistry::sorted() const
{
  std::vector<const Accessor *> out;
  out.reserve(accessors_.size());
  for (const auto & [_, accessor] : accessors_) {
    out.push_back(&accessor);
  }
  return out;
}

std::vector<const Accessor *> LocatorRegistry::accessors_for(const Artifact & artifact) const
{
  std::vector<const Accessor *> out;
  for (const auto & [_, accessor] : accessors_) {
    if (accessor.artifact == artifact) {
      out.push_back(&accessor);
    }
  }
  return out;
}

}  // namespace wfgraph
