#include "stepflow/scheduler/cancellation.hpp"

#include "stepflow/util/log.hpp"

#include <boost/asio/post.hpp>

namespace stepflow {

auto CancellationController::request_cancel() -> bool {
  if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
    return false;
  }
  stop_and_signal();
  return true;
}

auto CancellationController::request_stop() -> bool {
  return stop_and_signal();
}

auto CancellationController::stop_and_signal() -> bool {
  const bool first = !stopped_.exchange(true, std::memory_order_acq_rel);
  boost::asio::post(executor_, [self = shared_from_this()] {
    self->emit_all();
    if (self->wake_) {
      self->wake_();
    }
  });
  return first;
}

auto CancellationController::emit_all() -> void {
  if (!signals_.empty()) {
    log::debug("Cancelling {} in-flight step(s)", signals_.size());
  }
  for (auto &[step, signal] : signals_) {
    signal->emit(boost::asio::cancellation_type::terminal);
  }
}

auto CancellationController::register_step(const StepId &step)
    -> boost::asio::cancellation_slot {
  auto &signal = signals_[step];
  if (!signal) {
    signal = std::make_unique<boost::asio::cancellation_signal>();
  }
  return signal->slot();
}

} // namespace stepflow
