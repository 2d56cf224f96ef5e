#include <tessera/common/event_journal.hpp>

namespace tessera::common {

void event_journal::emit(std::string type,
                         std::initializer_list<attribute_t> attributes) {
  auto event = tessera::schema::transaction_event_t{};
  event.type = std::move(type);
  event.attributes.reserve(attributes.size());
  for (const auto& [key, value] : attributes) {
    // Identifiers and hex addresses are indexed; amounts and text are not.
    const auto indexed = key.ends_with("_id") || value.size() == 64;
    event.attributes.push_back(
        tessera::schema::transaction_event_attribute_t{
            .key = key, .value = value, .index = indexed});
  }
  events_.push_back(std::move(event));
}

}  // namespace tessera::common
