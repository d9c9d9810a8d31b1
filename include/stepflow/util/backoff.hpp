#pragma once

#include <algorithm>
#include <chrono>

namespace stepflow {

/// Capped exponential delay: min(initial * 2^attempt, max).
class ExponentialBackoff {
public:
  struct Config {
    std::chrono::milliseconds initial{1000};
    std::chrono::milliseconds max{60000};
  };

  ExponentialBackoff() = default;
  explicit ExponentialBackoff(Config cfg) : cfg_(cfg) {}

  /// Delay to wait after the failure of attempt `attempt` (0-based).
  [[nodiscard]] auto delay_for(int attempt) const noexcept
      -> std::chrono::milliseconds {
    if (cfg_.initial.count() <= 0 || attempt < 0) {
      return std::chrono::milliseconds{0};
    }
    auto delay = cfg_.initial;
    for (int i = 0; i < attempt && delay < cfg_.max; ++i) {
      delay *= 2;
    }
    return std::min(delay, cfg_.max);
  }

  /// Returns the next delay in the sequence and advances it.
  auto operator()() noexcept -> std::chrono::milliseconds {
    return delay_for(attempts_++);
  }

  void reset() { attempts_ = 0; }

  [[nodiscard]] auto attempts() const noexcept -> int { return attempts_; }

private:
  Config cfg_;
  int attempts_ = 0;
};

} // namespace stepflow
