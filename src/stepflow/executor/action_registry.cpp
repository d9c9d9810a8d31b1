#include "stepflow/executor/action.hpp"

#include "stepflow/util/log.hpp"

#include <ranges>

namespace stepflow {

auto ActionRegistry::register_action(std::string name, ActionHandler handler)
    -> Result<void> {
  if (name.empty() || !handler) {
    return fail(Error::InvalidArgument);
  }
  if (handlers_.contains(name)) {
    return fail(Error::AlreadyExists);
  }
  log::debug("Registered action '{}'", name);
  handlers_.emplace(std::move(name), std::move(handler));
  return ok();
}

auto ActionRegistry::has_action(std::string_view name) const -> bool {
  return handlers_.find(name) != handlers_.end();
}

auto ActionRegistry::registered_actions() const -> std::vector<std::string> {
  return handlers_ | std::views::keys | std::ranges::to<std::vector>();
}

auto ActionRegistry::invoke(ActionCall call) -> task<Result<JsonValue>> {
  auto it = handlers_.find(call.action_ref);
  if (it == handlers_.end()) {
    log::warn("Step '{}' references unknown action '{}'", call.step_id,
              call.action_ref);
    co_return fail(Error::ActionNotFound);
  }
  co_return co_await it->second(std::move(call));
}

} // namespace stepflow
