#include "stepflow/util/id.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <random>

namespace stepflow::detail {

auto generate_run_id_text() -> std::string {
  static std::atomic<std::uint16_t> sequence{0};
  thread_local std::mt19937_64 rng{std::random_device{}()};

  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const auto seq = sequence.fetch_add(1, std::memory_order_relaxed);
  const auto noise = rng() & 0xffff'ffff'ffffULL;
  return std::format("{:012x}{:04x}{:012x}",
                     static_cast<std::uint64_t>(millis) & 0xffff'ffff'ffffULL,
                     seq, noise);
}

} // namespace stepflow::detail
