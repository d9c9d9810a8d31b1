#pragma once

#include "stepflow/util/enum.hpp"
#include "stepflow/util/id.hpp"
#include "stepflow/util/json.hpp"

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace stepflow {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class WorkflowState : std::uint8_t {
  Pending,
  Running,
  Paused,
  Completed,
  Failed,
  PartialFailure,
  Deadlocked,
  Cancelled,
};
BOOST_DESCRIBE_ENUM(WorkflowState, Pending, Running, Paused, Completed, Failed,
                    PartialFailure, Deadlocked, Cancelled)
STEPFLOW_DEFINE_ENUM_SERDE(WorkflowState, WorkflowState::Pending)

[[nodiscard]] constexpr auto is_terminal(WorkflowState state) noexcept
    -> bool {
  switch (state) {
  case WorkflowState::Completed:
  case WorkflowState::Failed:
  case WorkflowState::PartialFailure:
  case WorkflowState::Deadlocked:
  case WorkflowState::Cancelled:
    return true;
  case WorkflowState::Pending:
  case WorkflowState::Running:
  case WorkflowState::Paused:
    return false;
  }
  return false;
}

enum class StepState : std::uint8_t { Completed, Failed };
BOOST_DESCRIBE_ENUM(StepState, Completed, Failed)
STEPFLOW_DEFINE_ENUM_SERDE(StepState, StepState::Failed)

// Why a step ended up in skipped_steps.
enum class SkipReason : std::uint8_t { UpstreamFailed, Aborted, Cancelled };
BOOST_DESCRIBE_ENUM(SkipReason, UpstreamFailed, Aborted, Cancelled)
STEPFLOW_DEFINE_ENUM_SERDE(SkipReason, SkipReason::UpstreamFailed)

struct StepResult {
  StepId step_id;
  std::string name;
  StepState state{StepState::Failed};
  JsonValue output{};
  std::optional<std::error_code> error;
  std::string error_message;
  int attempts{0};
  std::vector<TimePoint> attempt_started_at;
  TimePoint started_at{};
  TimePoint ended_at{};

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return state == StepState::Completed;
  }

  [[nodiscard]] auto duration() const -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ended_at -
                                                                 started_at);
  }
};

struct WorkflowResult {
  WorkflowId workflow_id;
  std::string name;
  WorkflowState state{WorkflowState::Pending};
  std::map<StepId, StepResult> completed_steps;
  std::set<StepId> failed_steps;
  std::set<StepId> skipped_steps;
  std::map<StepId, SkipReason> skip_reasons;
  // Every recorded StepResult, completed or failed.
  std::map<StepId, StepResult> step_results;
  std::string error;
  std::map<std::string, std::string> metadata;
  TimePoint submitted_at{};
  TimePoint started_at{};
  TimePoint ended_at{};

  [[nodiscard]] auto duration() const -> std::chrono::milliseconds {
    if (ended_at < started_at) {
      return std::chrono::milliseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(ended_at -
                                                                 started_at);
  }

  [[nodiscard]] auto find_step(const StepId &id) const -> const StepResult * {
    auto it = step_results.find(id);
    return it == step_results.end() ? nullptr : &it->second;
  }
};

} // namespace stepflow
