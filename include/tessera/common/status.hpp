#pragma once

#include <tessera/schema/transaction_error_code.hpp>

#include <optional>
#include <string>
#include <utility>

namespace tessera::common {

/// Reason a component operation was rejected. State is untouched on failure.
struct failure final {
  tessera::schema::transaction_error_code code{};
  std::string reason;
};

/// `std::nullopt` on success.
using status_t = std::optional<failure>;

inline status_t fail(const tessera::schema::transaction_error_code code,
                     std::string reason) {
  return failure{.code = code, .reason = std::move(reason)};
}

}  // namespace tessera::common
