#include <tessera/common/critical.hpp>
#include <tessera/storage/rocksdb/storage.hpp>

namespace tessera::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    tessera::common::critical("Failed to open RocksDB at {}: {}", path,
                              status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::require_open() const {
  if (!database) {
    tessera::common::critical("RocksDB database is not initialized");
  }
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  require_open();
  auto committed_raw = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedStateKey}, &committed_raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    tessera::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<
      std::tuple<int64_t, tessera::schema::hash32_t,
                 tessera::schema::timestamp_milliseconds_t, uint64_t>>(
      tessera::schema::bytes_view_t{
          reinterpret_cast<const uint8_t*>(committed_raw.data()),
          committed_raw.size()});
  if (!decoded.has_value()) {
    tessera::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value()),
                         .block_time = std::get<2>(decoded.value()),
                         .next_event_id = std::get<3>(decoded.value())};
}

void storage<rocksdb_storage_tag>::commit(
    const committed_state& state,
    const std::vector<key_value_entry_t>& entries) const {
  require_open();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(tessera::schema::bytes_view_t{key}),
                  detail::to_slice(tessera::schema::bytes_view_t{value}));
    if (!put_status.ok()) {
      tessera::common::critical("failed staging key for commit");
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root,
                                           state.block_time,
                                           state.next_event_id});
  auto state_status = batch.Put(
      std::string{detail::kCommittedStateKey},
      ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(encoded.data()),
                               encoded.size()});
  if (!state_status.ok()) {
    tessera::common::critical("failed staging committed state");
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit block to RocksDB: {}",
                  write_status.ToString());
    tessera::common::critical("failed to commit block");
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const tessera::schema::bytes_view_t& prefix) const {
  require_open();
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    tessera::common::critical("failed iterating RocksDB prefix");
  }
  return entries;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_range(
    const tessera::schema::bytes_view_t& first,
    const tessera::schema::bytes_view_t& last) const {
  require_open();
  auto entries = std::vector<key_value_entry_t>{};
  auto last_slice = detail::to_slice(last);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(detail::to_slice(first));
       iterator->Valid() && iterator->key().compare(last_slice) <= 0;
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    tessera::common::critical("failed iterating RocksDB range");
  }
  return entries;
}

}  // namespace tessera::storage
