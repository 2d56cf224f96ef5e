#pragma once

#include <tessera/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace tessera::testing {

/// Deterministic 32-byte value; seeds 1-5 are the fixture accounts.
inline tessera::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = tessera::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Unique scratch path under the temp directory. Several engines may be opened
/// within one clock tick, so a sequence number is appended.
inline std::string make_db_path(const std::string_view prefix) {
  static auto sequence = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::steady_clock::now().time_since_epoch().count();
  const auto name = std::string{prefix} + "_" +
                    std::to_string(static_cast<unsigned long long>(now)) + "_" +
                    std::to_string(sequence.fetch_add(1));
  return (std::filesystem::temp_directory_path() / name).string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace tessera::testing
