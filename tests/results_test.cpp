#include "stepflow/scheduler/result_aggregator.hpp"
#include "stepflow/util/id.hpp"
#include "stepflow/workflow/results.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <set>

using namespace stepflow;

TEST(EnumSerdeTest, WorkflowStateRoundTripsSnakeCase) {
  EXPECT_EQ(to_string_view(WorkflowState::PartialFailure), "partial_failure");
  EXPECT_EQ(to_string_view(WorkflowState::Deadlocked), "deadlocked");
  EXPECT_EQ(parse<WorkflowState>("partial_failure"),
            WorkflowState::PartialFailure);
  EXPECT_EQ(parse<WorkflowState>("PARTIAL-FAILURE"),
            WorkflowState::PartialFailure);
  EXPECT_EQ(parse<WorkflowState>("bogus"), WorkflowState::Pending);
}

TEST(EnumSerdeTest, SkipReasonNames) {
  EXPECT_EQ(to_string_view(SkipReason::UpstreamFailed), "upstream_failed");
  EXPECT_EQ(parse<SkipReason>("aborted"), SkipReason::Aborted);
  EXPECT_EQ(to_string_view(StepState::Completed), "completed");
}

TEST(WorkflowStateTest, TerminalStates) {
  EXPECT_FALSE(is_terminal(WorkflowState::Pending));
  EXPECT_FALSE(is_terminal(WorkflowState::Running));
  EXPECT_FALSE(is_terminal(WorkflowState::Paused));
  EXPECT_TRUE(is_terminal(WorkflowState::Completed));
  EXPECT_TRUE(is_terminal(WorkflowState::Failed));
  EXPECT_TRUE(is_terminal(WorkflowState::PartialFailure));
  EXPECT_TRUE(is_terminal(WorkflowState::Deadlocked));
  EXPECT_TRUE(is_terminal(WorkflowState::Cancelled));
}

TEST(ResultAggregatorTest, DeriveStateRules) {
  using RA = ResultAggregator;
  EXPECT_EQ(RA::derive_state(3, 0, 0), WorkflowState::Completed);
  EXPECT_EQ(RA::derive_state(0, 0, 0), WorkflowState::Completed);
  EXPECT_EQ(RA::derive_state(1, 1, 1), WorkflowState::PartialFailure);
  EXPECT_EQ(RA::derive_state(0, 1, 2), WorkflowState::PartialFailure);
  EXPECT_EQ(RA::derive_state(0, 2, 0), WorkflowState::Failed);
  EXPECT_EQ(RA::derive_state(2, 1, 0), WorkflowState::PartialFailure);
}

TEST(ResultAggregatorTest, RecordsStepsAndFirstError) {
  auto def = test::make_workflow("agg", {test::make_step("a", "x"),
                                         test::make_step("b", "x"),
                                         test::make_step("c", "x")});
  def.metadata["team"] = "infra";
  ResultAggregator agg(WorkflowId{"wf"}, def);
  EXPECT_EQ(agg.result().state, WorkflowState::Pending);
  agg.mark_started();
  EXPECT_EQ(agg.result().state, WorkflowState::Running);

  StepResult ok_step{.step_id = StepId{"a"}, .name = "a"};
  ok_step.state = StepState::Completed;
  ok_step.attempts = 1;
  agg.record(ok_step);

  StepResult bad{.step_id = StepId{"b"}, .name = "b"};
  bad.state = StepState::Failed;
  bad.attempts = 2;
  bad.error_message = "boom";
  agg.record(bad);

  agg.skip(StepId{"c"}, SkipReason::UpstreamFailed);
  // Already recorded steps are never also skipped.
  agg.skip(StepId{"a"}, SkipReason::Aborted);

  EXPECT_EQ(agg.finalize(), WorkflowState::PartialFailure);
  const auto &r = agg.result();
  EXPECT_EQ(r.metadata.at("team"), "infra");
  EXPECT_EQ(r.completed_steps.size(), 1);
  EXPECT_EQ(r.failed_steps, std::set<StepId>{StepId{"b"}});
  EXPECT_EQ(r.skipped_steps, std::set<StepId>{StepId{"c"}});
  EXPECT_EQ(r.step_results.size(), 2);
  EXPECT_EQ(r.error, "step 'b' failed: boom");
  EXPECT_LE(r.started_at, r.ended_at);
}

TEST(ResultAggregatorTest, ForcedStateWins) {
  auto def = test::make_workflow("agg", {test::make_step("a", "x")});
  ResultAggregator agg(WorkflowId{"wf"}, def);
  agg.mark_started();
  agg.skip(StepId{"a"}, SkipReason::Cancelled);
  EXPECT_EQ(agg.finalize(WorkflowState::Cancelled), WorkflowState::Cancelled);
  EXPECT_EQ(agg.result().skip_reasons.at(StepId{"a"}), SkipReason::Cancelled);
}

TEST(WorkflowIdTest, GeneratedIdsAreUniqueAndFixedWidth) {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; ++i) {
    auto id = generate_workflow_run_id();
    EXPECT_EQ(id.value().size(), 28);
    seen.insert(id.str());
  }
  EXPECT_EQ(seen.size(), 1000);
}
