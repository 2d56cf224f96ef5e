#include <tessera/common/busy_marker.hpp>

#include <utility>

namespace tessera::common {

std::optional<busy_marker> busy_marker::try_acquire(busy_set_t& held,
                                                    std::string resource) {
  if (held.contains(resource)) {
    return std::nullopt;
  }
  held.insert(resource);
  return busy_marker{held, std::move(resource)};
}

busy_marker::busy_marker(busy_set_t& held, std::string resource)
    : held_{&held}, resource_{std::move(resource)} {}

busy_marker::busy_marker(busy_marker&& other) noexcept
    : held_{std::exchange(other.held_, nullptr)},
      resource_{std::move(other.resource_)} {}

busy_marker::~busy_marker() {
  if (held_ != nullptr) {
    held_->erase(resource_);
  }
}

}  // namespace tessera::common
