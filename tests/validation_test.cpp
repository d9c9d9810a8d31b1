#include "stepflow/workflow/validation.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

using namespace stepflow;
using namespace std::chrono_literals;

TEST(StepBuilderTest, DefaultsNameToId) {
  auto step = Step::builder().id("extract").action("noop").build();
  ASSERT_TRUE(step.has_value());
  EXPECT_EQ(step->name, "extract");
  EXPECT_EQ(step->max_retries, 3);
  EXPECT_EQ(step->retry_base_delay, 1000ms);
  EXPECT_EQ(step->retry_max_delay, 60000ms);
  EXPECT_FALSE(step->timeout.has_value());
}

TEST(StepBuilderTest, RejectsMissingIdOrAction) {
  auto no_id = Step::builder().action("noop").build();
  ASSERT_FALSE(no_id.has_value());
  EXPECT_EQ(no_id.error(), Error::InvalidArgument);

  auto no_action = Step::builder().id("a").build();
  ASSERT_FALSE(no_action.has_value());
  EXPECT_EQ(no_action.error(), Error::InvalidArgument);
}

TEST(WorkflowBuilderTest, RejectsZeroParallelism) {
  auto def = WorkflowDefinition::builder().name("wf").max_parallel(0).build();
  ASSERT_FALSE(def.has_value());
  EXPECT_EQ(def.error(), Error::InvalidArgument);
}

TEST(WorkflowBuilderTest, KeepsDescriptiveFields) {
  auto def = WorkflowDefinition::builder()
                 .id("nightly")
                 .name("Nightly ETL")
                 .description("loads the warehouse")
                 .version("2.1.0")
                 .metadata("owner", "data")
                 .timeout(5s)
                 .build();
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->workflow_id, WorkflowId{"nightly"});
  EXPECT_EQ(def->version, "2.1.0");
  EXPECT_EQ(def->metadata.at("owner"), "data");
  EXPECT_EQ(def->timeout, 5000ms);
  EXPECT_EQ(def->max_parallel_steps, 5);
  EXPECT_FALSE(def->continue_on_error);
}

TEST(ValidationTest, AcceptsWellFormedWorkflow) {
  auto def = test::make_workflow(
      "ok", {test::make_step("a", "noop"), test::make_step("b", "noop", {"a"})});
  auto graph = build_workflow_graph(def);
  ASSERT_TRUE(graph.has_value());
  EXPECT_EQ(graph->size(), 2);
  EXPECT_TRUE(validate(def).has_value());
}

TEST(ValidationTest, EmptyWorkflowIsValid) {
  auto def = test::make_workflow("empty", {});
  EXPECT_TRUE(validate(def).has_value());
}

TEST(ValidationTest, DuplicateStepIdIsRejected) {
  auto def = test::make_workflow(
      "dup", {test::make_step("a", "noop"), test::make_step("a", "noop")});
  auto valid = validate(def);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error().code, Error::DuplicateStep);
  EXPECT_EQ(valid.error().steps, std::vector<StepId>{StepId{"a"}});
}

TEST(ValidationTest, DanglingDependencyIsRejected) {
  auto def = test::make_workflow("dangling",
                                 {test::make_step("a", "noop", {"missing"})});
  auto valid = validate(def);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error().code, Error::DanglingReference);
}

TEST(ValidationTest, CycleIsRejected) {
  auto def = test::make_workflow("cycle", {test::make_step("a", "noop", {"b"}),
                                           test::make_step("b", "noop", {"a"})});
  auto valid = validate(def);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error().code, Error::CycleDetected);
}

TEST(ValidationTest, RetryPolicyIsChecked) {
  auto step = test::make_step("a", "noop");
  step.retry_base_delay = 500ms;
  step.retry_max_delay = 100ms;
  auto def = test::make_workflow("retry", {step});
  auto valid = validate(def);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error().code, Error::InvalidArgument);
  EXPECT_EQ(valid.error().steps, std::vector<StepId>{StepId{"a"}});

  def.steps[0] = test::make_step("a", "noop");
  def.steps[0].max_retries = -1;
  EXPECT_FALSE(validate(def).has_value());
}

TEST(ValidationTest, NonPositiveTimeoutsAreRejected) {
  auto def = test::make_workflow("timeouts", {test::make_step("a", "noop")});
  def.steps[0].timeout = 0ms;
  EXPECT_FALSE(validate(def).has_value());

  def.steps[0].timeout.reset();
  def.timeout = -1ms;
  EXPECT_FALSE(validate(def).has_value());
}

TEST(ValidationTest, ParallelismBelowOneIsRejected) {
  auto def = test::make_workflow("p", {test::make_step("a", "noop")});
  def.max_parallel_steps = 0;
  auto valid = validate(def);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error().code, Error::InvalidArgument);
}
