#pragma once

#include "stepflow/core/coroutine.hpp"
#include "stepflow/core/error.hpp"
#include "stepflow/util/id.hpp"
#include "stepflow/util/json.hpp"
#include "stepflow/workflow/execution_context.hpp"

#include <flat_map>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace stepflow {

/// Everything an action sees for one attempt. The context is a snapshot
/// taken when the step was dispatched.
struct ActionCall {
  StepId step_id;
  std::string action_ref;
  JsonValue params{};
  std::shared_ptr<const ExecutionContext> context;
  int attempt{0};
};

/// Resolves an action reference and runs it. Implementations must honour
/// Asio cancellation delivered to the awaiting coroutine.
class IActionResolver {
public:
  virtual ~IActionResolver() = default;

  [[nodiscard]] virtual auto invoke(ActionCall call)
      -> task<Result<JsonValue>> = 0;
};

using ActionHandler = std::function<task<Result<JsonValue>>(ActionCall)>;

/// Name-to-handler table owned by one engine. Populate before submitting
/// workflows; it is only read while they run.
class ActionRegistry final : public IActionResolver {
public:
  auto register_action(std::string name, ActionHandler handler) -> Result<void>;

  [[nodiscard]] auto has_action(std::string_view name) const -> bool;
  [[nodiscard]] auto registered_actions() const -> std::vector<std::string>;

  [[nodiscard]] auto invoke(ActionCall call)
      -> task<Result<JsonValue>> override;

private:
  std::flat_map<std::string, ActionHandler, std::less<>> handlers_;
};

/// Runs params.command with /bin/sh -c and yields its stdout as a JSON
/// string. A non-zero exit is ActionFailed; on cancellation the child is
/// killed and reaped.
[[nodiscard]] auto make_shell_action() -> ActionHandler;

} // namespace stepflow
