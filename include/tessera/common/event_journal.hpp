#pragma once

#include <tessera/schema/transaction_event.hpp>

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace tessera::common {

/// Events raised while one transaction executes. Discarded with the scratch
/// state when the transaction fails.
class event_journal final {
 public:
  using attribute_t = std::pair<std::string, std::string>;

  void emit(std::string type, std::initializer_list<attribute_t> attributes);

  const std::vector<tessera::schema::transaction_event_t>& events() const {
    return events_;
  }
  std::vector<tessera::schema::transaction_event_t> take() {
    return std::exchange(events_, {});
  }

 private:
  std::vector<tessera::schema::transaction_event_t> events_;
};

}  // namespace tessera::common
