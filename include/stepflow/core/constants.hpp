#pragma once

#include <chrono>
#include <cstddef>

namespace stepflow {

namespace io {
constexpr std::size_t kReadBufferSize = 4096;
constexpr std::size_t kInitialOutputReserve = 8192;
constexpr std::size_t kMaxOutputSize = 10UZ * 1024 * 1024;
} // namespace io

namespace step_defaults {
constexpr int kMaxRetries = 3;
constexpr auto kRetryBaseDelay = std::chrono::milliseconds(1000);
constexpr auto kRetryMaxDelay = std::chrono::milliseconds(60000);
} // namespace step_defaults

namespace workflow_defaults {
constexpr int kMaxParallelSteps = 5;
constexpr std::size_t kListLimit = 100;
} // namespace workflow_defaults

namespace timing {
constexpr auto kAwaitPollInterval = std::chrono::milliseconds(10);
constexpr auto kShutdownPollInterval = std::chrono::milliseconds(10);
} // namespace timing

} // namespace stepflow
