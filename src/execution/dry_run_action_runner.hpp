#pragma once

#include "execution/action_runner.hpp"

#include <string>

namespace gridrun::execution {

// Reports every action as succeeded without running it. Used by `run
// --dry-run` to exercise matrix resolution, planning and step gating alone.
class DryRunActionRunner final : public IActionRunner {
public:
  std::string Name() const override;
  bool Run(const ActionRequest& request, ActionResult& result, std::string& error) override;
};

} // namespace gridrun::execution
