// wfgraph/analysis/artifact_catalog.cpp - Named sets of artifacts
#include "wfgraph/analysis/artifact_catalog.hpp"

namespace wfgraph
{

ArtifactCatalog::ArtifactCatalog(const std::vector<std::string> & entries)
{
  for (const auto & e : entries) {
    add(e);
  }
}

void ArtifactCatalog::add(const std::string & entry)
{
  if (entry.empty()) {
    return;
  }
  entries_.push_back(entry);

  if (entry.size() > 2 && entry.compare(entry.size() - 2, 2, "/*") == 0) {
    categories_.insert(entry.substr(0, entry.size() - 2));
  } else if (entry.find('/') != std::string::npos) {
    keys_.insert(entry);
  } else {
    names_.insert(entry);
  }
}

bool ArtifactCatalog::matches(const Artifact & artifact) const
{
  return keys_.count(artifact.key()) > 0 || names_.count(artifact.name_template) > 0 ||
         categories_.count(artifact.category) > 0;
}

}  // namespace wfgraph
