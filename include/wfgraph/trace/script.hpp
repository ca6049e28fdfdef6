// wfgraph/trace/script.hpp - Scripts as seen by the tracer
//
// A script is anything with a name that can be run against a Locator. The
// tracer does not know what a script computes, only how to run it under
// interception.
//
#pragma once

#include <functional>
#include <string>
#include <vector>

#include "wfgraph/locator/locator.hpp"

namespace wfgraph
{

class Script
{
public:
  virtual ~Script() = default;

  [[nodiscard]] virtual const std::string & name() const noexcept = 0;

  /**
   * Run the script logic. Every path must be obtained through `locator`.
   */
  virtual void run(Locator & locator) const = 0;
};

/**
 * A script described by its accessor lists (from the catalog).
 *
 * Running it calls every input accessor, then every output accessor, in
 * declaration order.
 */
class DeclaredScript : public Script
{
public:
  DeclaredScript(std::string name, std::vector<std::string> inputs, std::vector<std::string> outputs);

  [[nodiscard]] const std::string & name() const noexcept override { return name_; }
  void run(Locator & locator) const override;

  [[nodiscard]] const std::vector<std::string> & inputs() const noexcept { return inputs_; }
  [[nodiscard]] const std::vector<std::string> & outputs() const noexcept { return outputs_; }

private:
  std::string name_;
  std::vector<std::string> inputs_;
  std::vector<std::string> outputs_;
};

/**
 * A script backed by an arbitrary callable.
 */
class FunctionScript : public Script
{
public:
  using RunFn = std::function<void(Locator &)>;

  FunctionScript(std::string name, RunFn fn);

  [[nodiscard]] const std::string & name() const noexcept override { return name_; }
  void run(Locator & locator) const override;

private:
  std::string name_;
  RunFn fn_;
};

}  // namespace wfgraph
