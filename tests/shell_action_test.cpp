#include "stepflow/executor/action.hpp"
#include "stepflow/executor/step_executor.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <filesystem>
#include <fstream>

using namespace stepflow;
using namespace std::chrono_literals;

class ShellActionTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(registry_.register_action("shell", make_shell_action()));
  }

  auto run(std::string command, std::optional<std::chrono::milliseconds>
                                    timeout = std::nullopt) -> AttemptOutcome {
    auto step = Step::builder()
                    .id("sh")
                    .action("shell")
                    .params(JsonValue{{"command", std::move(command)}})
                    .build();
    EXPECT_TRUE(step.has_value());
    step->timeout = timeout;
    return test::run_coro(executor_.execute_attempt(
        *step, std::make_shared<const ExecutionContext>(), 0));
  }

  ActionRegistry registry_;
  StepExecutor executor_{registry_};
};

TEST_F(ShellActionTest, ReturnsStdout) {
  auto outcome = run("echo hello");
  ASSERT_TRUE(outcome.succeeded()) << outcome.error_message;
  ASSERT_TRUE(outcome.value->is_string());
  EXPECT_EQ(outcome.value->get_string(), "hello\n");
}

TEST_F(ShellActionTest, NonZeroExitFails) {
  auto outcome = run("echo oops >&2; exit 3");
  ASSERT_FALSE(outcome.succeeded());
  EXPECT_EQ(outcome.value.error(), Error::ActionFailed);
}

TEST_F(ShellActionTest, MissingCommandIsInvalid) {
  auto step = test::make_step("sh", "shell");
  auto outcome = test::run_coro(executor_.execute_attempt(
      step, std::make_shared<const ExecutionContext>(), 0));
  ASSERT_FALSE(outcome.succeeded());
  EXPECT_EQ(outcome.value.error(), Error::InvalidArgument);
}

TEST_F(ShellActionTest, TimeoutKillsTheChild) {
  auto marker = std::filesystem::temp_directory_path() /
                "stepflow_shell_timeout_marker";
  std::filesystem::remove(marker);

  const auto begin = std::chrono::steady_clock::now();
  auto outcome = run("sleep 1; touch " + marker.string(), 100ms);
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  ASSERT_FALSE(outcome.succeeded());
  EXPECT_EQ(outcome.value.error(), Error::Timeout);
  EXPECT_LT(elapsed, 900ms);

  std::this_thread::sleep_for(1500ms);
  EXPECT_FALSE(std::filesystem::exists(marker));
}
