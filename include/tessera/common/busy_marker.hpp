#pragma once

#include <optional>
#include <set>
#include <string>

namespace tessera::common {

/// Set of resources currently inside an external value or asset transfer.
using busy_set_t = std::set<std::string>;

/// Scoped marker that holds a resource busy for the lifetime of the object.
///
/// Acquisition fails when the resource is already held, which is how a
/// re-entrant call made from inside a transfer callback gets rejected. The
/// marker is released on destruction regardless of how the scope exits.
class busy_marker final {
 public:
  static std::optional<busy_marker> try_acquire(busy_set_t& held,
                                                std::string resource);

  busy_marker(const busy_marker&) = delete;
  busy_marker& operator=(const busy_marker&) = delete;
  busy_marker(busy_marker&& other) noexcept;
  busy_marker& operator=(busy_marker&&) = delete;
  ~busy_marker();

  const std::string& resource() const { return resource_; }

 private:
  busy_marker(busy_set_t& held, std::string resource);

  busy_set_t* held_{nullptr};
  std::string resource_;
};

}  // namespace tessera::common
