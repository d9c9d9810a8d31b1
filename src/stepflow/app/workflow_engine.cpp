#include "stepflow/app/workflow_engine.hpp"

#include "stepflow/core/runtime.hpp"
#include "stepflow/io/context.hpp"
#include "stepflow/scheduler/cancellation.hpp"
#include "stepflow/scheduler/coordinator.hpp"
#include "stepflow/scheduler/result_aggregator.hpp"
#include "stepflow/util/hash.hpp"
#include "stepflow/util/log.hpp"
#include "stepflow/workflow/validation.hpp"

#include <boost/asio/this_coro.hpp>

#include <algorithm>
#include <optional>
#include <ranges>
#include <string>
#include <thread>
#include <utility>

namespace stepflow {

WorkflowEngine::WorkflowEngine(Runtime &runtime, IActionResolver &resolver,
                               EngineConfig config)
    : runtime_(runtime), step_executor_(resolver),
      config_(std::move(config.engine)) {
  config_.max_concurrent_workflows =
      std::max(config_.max_concurrent_workflows, 1);
  config_.max_retained_results =
      std::max<std::size_t>(config_.max_retained_results, 1);
}

WorkflowEngine::~WorkflowEngine() { shutdown(); }

auto WorkflowEngine::submit(WorkflowDefinition def,
                            ExecutionContext initial_context,
                            ValidationError *diagnostic) -> Result<WorkflowId> {
  if (!runtime_.is_running()) {
    return fail(Error::SystemNotRunning);
  }

  auto graph = build_workflow_graph(def);
  if (!graph) {
    auto code = graph.error().code;
    if (diagnostic) {
      *diagnostic = std::move(graph.error());
    }
    return fail(code);
  }

  if (def.workflow_id.empty()) {
    def.workflow_id = generate_workflow_run_id();
  }
  const auto id = def.workflow_id;

  auto record = std::make_shared<WorkflowRecord>();
  record->id = id;
  record->owner =
      static_cast<shard_id>(util::shard_of(id, runtime_.shard_count()));
  record->cancellation = std::make_shared<CancellationController>(
      runtime_.executor_for(record->owner));
  record->graph.emplace(std::move(*graph));
  record->initial_context = std::move(initial_context);
  record->snapshot.workflow_id = id;
  record->snapshot.name = def.name;
  record->snapshot.metadata = def.metadata;
  record->snapshot.state = WorkflowState::Pending;
  record->snapshot.submitted_at = Clock::now();
  record->definition =
      std::make_shared<const WorkflowDefinition>(std::move(def));

  bool start_now = false;
  {
    std::scoped_lock lock(mu_);
    if (shutting_down_) {
      return fail(Error::SystemNotRunning);
    }
    if (auto it = records_.find(id); it != records_.end()) {
      const auto &previous = it->second;
      std::scoped_lock record_lock(previous->mu);
      if (!previous->done) {
        return fail(Error::AlreadyExists);
      }
      std::erase(finished_, previous);
    }
    record->seq = next_seq_++;
    records_.insert_or_assign(id, record);
    if (running_ < static_cast<std::size_t>(config_.max_concurrent_workflows)) {
      ++running_;
      start_now = true;
    } else {
      pending_.push_back(record);
    }
  }

  log::info("Submitted workflow {} ('{}', {} step(s)) on shard {}{}", id,
            record->definition->name, record->definition->steps.size(),
            record->owner, start_now ? "" : ", queued");
  if (start_now) {
    launch(record);
  }
  return ok(id);
}

auto WorkflowEngine::find(const WorkflowId &id) const -> RecordPtr {
  std::scoped_lock lock(mu_);
  auto it = records_.find(id);
  return it == records_.end() ? nullptr : it->second;
}

auto WorkflowEngine::launch(RecordPtr record) -> void {
  const auto owner = record->owner;
  runtime_.spawn_on(owner, drive(std::move(record)));
}

// Runs on the owner shard. The coordinator is created here so its wake
// handler is installed on the same executor the cancellation posts to.
auto WorkflowEngine::drive(RecordPtr record) -> task<void> {
  co_await boost::asio::this_coro::throw_if_cancelled(false);

  auto coordinator = ExecutionCoordinator::create({
      .executor = co_await boost::asio::this_coro::executor,
      .workflow_id = record->id,
      .definition = record->definition,
      .graph = std::move(*record->graph),
      .initial_context = std::move(record->initial_context),
      .step_executor = &step_executor_,
      .cancellation = record->cancellation,
      .on_progress =
          [weak = std::weak_ptr<WorkflowRecord>(record)](
              const WorkflowResult &progress) {
            if (auto rec = weak.lock()) {
              publish(*rec, progress);
            }
          },
  });
  record->graph.reset();
  {
    std::scoped_lock lock(record->mu);
    record->coordinator = coordinator;
  }
  {
    std::scoped_lock lock(mu_);
    std::erase_if(live_coordinators_,
                  [](const auto &weak) { return weak.expired(); });
    live_coordinators_.push_back(coordinator);
  }

  WorkflowResult result;
  std::optional<std::string> crashed;
  try {
    result = co_await coordinator->run();
  } catch (const std::exception &e) {
    crashed = e.what();
  } catch (...) {
    crashed = "unknown exception";
  }
  if (crashed) {
    log::error("Workflow {} coordinator failed: {}", record->id, *crashed);
    {
      std::scoped_lock lock(record->mu);
      result = record->snapshot;
    }
    result.state = WorkflowState::Failed;
    result.error = std::move(*crashed);
    result.ended_at = Clock::now();
  }
  coordinator.reset();
  on_finished(record, std::move(result));
}

auto WorkflowEngine::publish(WorkflowRecord &record,
                             const WorkflowResult &progress) -> void {
  std::scoped_lock lock(record.mu);
  if (record.done) {
    return;
  }
  const auto submitted_at = record.snapshot.submitted_at;
  record.snapshot = progress;
  record.snapshot.submitted_at = submitted_at;
  // The coordinator notices a pause on its next loop turn; report the
  // requested state right away.
  if (record.paused && progress.state == WorkflowState::Running) {
    record.snapshot.state = WorkflowState::Paused;
  } else if (!record.paused && progress.state == WorkflowState::Paused) {
    record.snapshot.state = WorkflowState::Running;
  }
}

auto WorkflowEngine::on_finished(const RecordPtr &record,
                                 WorkflowResult result) -> void {
  seal_record(record, std::move(result));

  RecordPtr next;
  {
    std::scoped_lock lock(mu_);
    if (running_ > 0) {
      --running_;
    }
    if (!shutting_down_ && !pending_.empty()) {
      next = std::move(pending_.front());
      pending_.pop_front();
      ++running_;
    }
  }
  if (next) {
    log::debug("Starting queued workflow {}", next->id);
    launch(std::move(next));
  }
}

// A queued workflow that is cancelled before it ever ran.
auto WorkflowEngine::finish_unstarted(const RecordPtr &record) -> void {
  ResultAggregator aggregator(record->id, *record->definition);
  aggregator.mark_started();
  for (const auto &step : record->definition->steps) {
    aggregator.skip(step.step_id, SkipReason::Cancelled);
  }
  aggregator.set_error("workflow cancelled");
  aggregator.finalize(WorkflowState::Cancelled);
  seal_record(record, aggregator.take());
}

auto WorkflowEngine::seal_record(const RecordPtr &record,
                                 WorkflowResult result) -> void {
  {
    std::scoped_lock lock(record->mu);
    result.submitted_at = record->snapshot.submitted_at;
    record->snapshot = std::move(result);
    record->paused = false;
    record->done = true;
  }
  record->cv.notify_all();

  std::scoped_lock lock(mu_);
  finished_.push_back(record);
  evict_finished_locked();
}

auto WorkflowEngine::evict_finished_locked() -> void {
  while (finished_.size() > config_.max_retained_results) {
    auto oldest = std::move(finished_.front());
    finished_.pop_front();
    if (auto it = records_.find(oldest->id);
        it != records_.end() && it->second == oldest) {
      records_.erase(it);
      log::debug("Evicted result of workflow {}", oldest->id);
    }
  }
}

auto WorkflowEngine::await_result(const WorkflowId &id,
                                  std::optional<std::chrono::milliseconds>
                                      timeout) -> Result<WorkflowResult> {
  auto record = find(id);
  if (!record) {
    return fail(Error::NotFound);
  }
  std::unique_lock lock(record->mu);
  auto is_done = [&] { return record->done; };
  if (timeout) {
    if (!record->cv.wait_for(lock, *timeout, is_done)) {
      return fail(Error::Timeout);
    }
  } else {
    record->cv.wait(lock, is_done);
  }
  return ok(record->snapshot);
}

auto WorkflowEngine::async_await_result(WorkflowId id)
    -> task<Result<WorkflowResult>> {
  auto record = find(id);
  if (!record) {
    co_return fail(Error::NotFound);
  }
  for (;;) {
    {
      std::scoped_lock lock(record->mu);
      if (record->done) {
        co_return ok(record->snapshot);
      }
    }
    if (auto slept = co_await io::async_sleep(timing::kAwaitPollInterval);
        !slept) {
      co_return fail(slept.error());
    }
  }
}

auto WorkflowEngine::cancel(const WorkflowId &id) -> Result<bool> {
  RecordPtr record;
  bool was_queued = false;
  {
    std::scoped_lock lock(mu_);
    auto it = records_.find(id);
    if (it == records_.end()) {
      return fail(Error::NotFound);
    }
    record = it->second;
    if (auto pos = std::ranges::find(pending_, record); pos != pending_.end()) {
      pending_.erase(pos);
      was_queued = true;
    }
  }

  if (was_queued) {
    log::info("Workflow {} cancelled while queued", id);
    finish_unstarted(record);
    return ok(true);
  }

  {
    std::scoped_lock lock(record->mu);
    if (record->done || is_terminal(record->snapshot.state)) {
      return ok(false);
    }
  }
  if (record->cancellation->request_cancel()) {
    log::info("Workflow {} cancellation requested", id);
  }
  return ok(true);
}

auto WorkflowEngine::pause(const WorkflowId &id) -> Result<bool> {
  auto record = find(id);
  if (!record) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(record->mu);
  auto coordinator = record->coordinator.lock();
  if (record->done || !coordinator ||
      record->snapshot.state != WorkflowState::Running) {
    return ok(false);
  }
  if (!coordinator->pause()) {
    return ok(false);
  }
  record->paused = true;
  record->snapshot.state = WorkflowState::Paused;
  return ok(true);
}

auto WorkflowEngine::resume(const WorkflowId &id) -> Result<bool> {
  auto record = find(id);
  if (!record) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(record->mu);
  auto coordinator = record->coordinator.lock();
  if (record->done || !coordinator ||
      record->snapshot.state != WorkflowState::Paused) {
    return ok(false);
  }
  if (!coordinator->resume()) {
    return ok(false);
  }
  record->paused = false;
  record->snapshot.state = WorkflowState::Running;
  return ok(true);
}

auto WorkflowEngine::get_status(const WorkflowId &id) const
    -> Result<WorkflowResult> {
  auto record = find(id);
  if (!record) {
    return fail(Error::NotFound);
  }
  std::scoped_lock lock(record->mu);
  return ok(record->snapshot);
}

auto WorkflowEngine::list_workflows(std::optional<WorkflowState> state,
                                    std::size_t limit) const
    -> std::vector<WorkflowResult> {
  std::vector<RecordPtr> records;
  {
    std::scoped_lock lock(mu_);
    records.reserve(records_.size());
    for (const auto &[id, record] : records_) {
      records.push_back(record);
    }
  }
  std::ranges::sort(records, {}, &WorkflowRecord::seq);

  std::vector<WorkflowResult> out;
  for (const auto &record : records) {
    if (out.size() >= limit) {
      break;
    }
    std::scoped_lock lock(record->mu);
    if (!state || record->snapshot.state == *state) {
      out.push_back(record->snapshot);
    }
  }
  return out;
}

auto WorkflowEngine::active_count() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return running_;
}

auto WorkflowEngine::pending_count() const -> std::size_t {
  std::scoped_lock lock(mu_);
  return pending_.size();
}

auto WorkflowEngine::shutdown() -> void {
  std::deque<RecordPtr> queued;
  std::vector<RecordPtr> all;
  std::vector<std::weak_ptr<ExecutionCoordinator>> coordinators;
  {
    std::scoped_lock lock(mu_);
    shutting_down_ = true;
    queued.swap(pending_);
    all.reserve(records_.size());
    for (const auto &[id, record] : records_) {
      all.push_back(record);
    }
    coordinators = live_coordinators_;
  }

  for (const auto &record : queued) {
    finish_unstarted(record);
  }

  std::size_t cancelled = 0;
  for (const auto &record : all) {
    bool live = false;
    {
      std::scoped_lock lock(record->mu);
      live = !record->done;
    }
    if (live && record->cancellation->request_cancel()) {
      ++cancelled;
    }
  }
  if (cancelled > 0 || !queued.empty()) {
    log::info("Engine shutdown: cancelled {} running and {} queued "
              "workflow(s)",
              cancelled, queued.size());
  }

  if (!runtime_.is_running() || runtime_.is_current_shard()) {
    return;
  }

  // Aborted workflows may still have step tasks unwinding after their
  // result was sealed; those keep the coordinator alive.
  auto idle = [&] {
    return std::ranges::all_of(all,
                               [](const RecordPtr &record) {
                                 std::scoped_lock lock(record->mu);
                                 return record->done;
                               }) &&
           std::ranges::all_of(coordinators,
                               [](const auto &weak) { return weak.expired(); });
  };
  const auto deadline = std::chrono::steady_clock::now() +
                        config_.shutdown_timeout;
  while (!idle()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      log::error("Engine shutdown timed out after {}ms with workflows still "
                 "running",
                 config_.shutdown_timeout.count());
      return;
    }
    std::this_thread::sleep_for(timing::kShutdownPollInterval);
  }
}

} // namespace stepflow
