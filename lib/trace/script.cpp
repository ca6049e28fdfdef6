// wfgraph/trace/script.cpp - Script variants
#include "wfgraph/trace/script.hpp"

#include <utility>

namespace wfgraph
{

DeclaredScript::DeclaredScript(
  std::string name, std::vector<std::string> inputs, std::vector<std::string> outputs)
: name_(std::move(name)), inputs_(std::move(inputs)), outputs_(std::move(outputs))
{
}

void DeclaredScript::run(Locator & locator) const
{
  for (const auto & accessor : inputs_) {
    (void)locator.path(accessor);
  }
  for (const auto & accessor : outputs_) {
    (void)locator.path(accessor);
  }
}

FunctionScript::FunctionScript(std::string name, RunFn fn)
: name_(std::move(name)), fn_(std::move(fn))
{
}

void FunctionScript::run(Locator & locator) const
{
  if (fn_) {
    fn_(locator);
  }
}

}  // namespace wfgraph
