#pragma once
#include <tessera/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace tessera::storage {

using key_value_entry_t =
    std::pair<tessera::schema::bytes_t, tessera::schema::bytes_t>;

/// Last committed block checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  tessera::schema::hash32_t state_root{};
  tessera::schema::timestamp_milliseconds_t block_time{};
  uint64_t next_event_id{1};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tessera::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const tessera::schema::bytes_view_t& key,
           const T& value) const;

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Persist the checkpoint together with `entries` in one atomic write.
  void commit(const committed_state& state,
              const std::vector<key_value_entry_t>& entries) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const tessera::schema::bytes_view_t& prefix) const;

  /// Return key-value pairs in `[first, last]`, ordered by key.
  std::vector<key_value_entry_t> list_range(
      const tessera::schema::bytes_view_t& first,
      const tessera::schema::bytes_view_t& last) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tessera::storage
