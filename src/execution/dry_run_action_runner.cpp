#include "execution/dry_run_action_runner.hpp"

namespace gridrun::execution {

std::string DryRunActionRunner::Name() const {
  return "dry_run";
}

bool DryRunActionRunner::Run(const ActionRequest& request, ActionResult& result,
                             std::string& error) {
  error.clear();
  result = ActionResult{};
  result.note = "dry run: " + request.action + " not executed";
  return true;
}

} // namespace gridrun::execution
