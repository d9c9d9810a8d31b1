#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace stepflow::util {

// MurmurHash3 64-bit finalizer
[[nodiscard]] inline constexpr auto murmur3_mix64(std::uint64_t h) noexcept
    -> std::uint64_t {
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdULL;
  h ^= h >> 33;
  h *= 0xc4ceb9fe1a85ec53ULL;
  h ^= h >> 33;
  return h;
}

// Shard calculation (Seastar-style): remix std::hash before the modulo so
// ids sharing a prefix still spread across shards.
template <typename Key>
[[nodiscard]] inline auto shard_of(const Key &key, unsigned shard_count) noexcept
    -> unsigned {
  const auto h = static_cast<std::uint64_t>(std::hash<Key>{}(key));
  return static_cast<unsigned>(murmur3_mix64(h) % shard_count);
}

} // namespace stepflow::util
