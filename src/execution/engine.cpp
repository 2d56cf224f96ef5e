#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <boost/endian/conversion.hpp>
#include <tessera/blake3/hash.hpp>
#include <tessera/common/critical.hpp>
#include <tessera/crypto/verify.hpp>
#include <tessera/custody/system_accounts.hpp>
#include <tessera/execution/engine.hpp>
#include <tessera/execution/runtime.hpp>
#include <tessera/schema/proposal_status.hpp>
#include <tessera/schema/query_error_code.hpp>
#include <tessera/schema/transaction_error_code.hpp>
#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>

using namespace tessera::schema;

namespace {

using encoder_t = tessera::encoding::scale_encoder_t;

inline constexpr auto kWorldStateKey = std::string_view{"SYS|APP|WORLD"};
inline constexpr auto kEventPrefix = std::string_view{"EVT|"};
inline constexpr auto kMaxEventsPerQuery = uint64_t{1000};

bytes_t make_event_key(const uint64_t event_id) {
  auto key = make_bytes(kEventPrefix);
  auto big_endian = boost::endian::native_to_big(event_id);
  auto raw = reinterpret_cast<const uint8_t*>(&big_endian);
  key.insert(std::end(key), raw, raw + sizeof(big_endian));
  return key;
}

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint64_t index) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return tessera::blake3::hash(bytes_view_t{material.data(), material.size()});
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "transaction bytes are not a valid SCALE envelope";
  }
  return tx;
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       std::string log,
                                       std::string info,
                                       const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.height = height;
  result.codespace = "tessera.query";
  return result;
}

template <typename Map, typename Key>
auto lookup(const Map& map, const Key& key)
    -> std::optional<typename Map::mapped_type> {
  auto entry = map.find(key);
  if (entry == std::end(map)) {
    return std::nullopt;
  }
  return entry->second;
}

}  // namespace

namespace tessera::execution {

bytes_t signing_bytes(const transaction_t& tx) {
  auto encoder = encoder_t{};
  return encoder.encode(
      std::tuple{tx.version, tx.chain_id, tx.nonce, tx.signer, tx.payload});
}

engine::engine(
    tessera::encoding::scale_encoder_t& encoder,
    tessera::storage::storage<tessera::storage::rocksdb_storage_tag>& storage,
    const tessera::config::genesis_t& genesis,
    const bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{tessera::crypto::verify_signature} {
  auto lock = std::scoped_lock{mutex_};
  if (require_strict_crypto_ && !tessera::crypto::available()) {
    tessera::common::critical(
        "strict crypto requested but OpenSSL lacks ed25519 support");
  }
  if (!require_strict_crypto_) {
    spdlog::warn("Signature verification disabled");
  }
  load_persisted_state(genesis);
  spdlog::info("Execution engine ready at height {} (next event id {})",
               last_committed_height_, next_event_id_);
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", decode_error,
                             "tessera.checktx");
  }
  return validate_transaction(*maybe_tx, committed_world_, "tessera.checktx");
}

block_result_t engine::finalize_block(
    const uint64_t height,
    const timestamp_milliseconds_t block_time,
    const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.height = height;
  result.block_time = block_time;
  result.tx_results.reserve(txs.size());

  if (auto rejected = validate_block(height, block_time)) {
    spdlog::warn("Rejected block {}: {}", height, rejected->info);
    result.tx_results.assign(txs.size(), *rejected);
    result.state_root = last_committed_state_root_;
    pending_height_ = 0;
    return result;
  }

  auto world = committed_world_;
  auto events = std::vector<event_record_t>{};
  auto next_event_id = next_event_id_;
  auto rolling_hash = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(
        bytes_view_t{txs[i].data(), txs[i].size()}, decode_error);
    if (!maybe_tx) {
      result.tx_results.push_back(make_error_result(
          transaction_error_code::invalid_transaction, "invalid transaction",
          decode_error, "tessera.finalize"));
      continue;
    }
    auto validation =
        validate_transaction(*maybe_tx, world, "tessera.finalize");
    if (!accepted(validation)) {
      result.tx_results.push_back(std::move(validation));
      continue;
    }

    auto tx_result = execute_transaction(*maybe_tx, world, block_time);
    if (accepted(tx_result)) {
      rolling_hash = fold_state_root(rolling_hash, txs[i], height, i);
      for (const auto& event : tx_result.events) {
        events.push_back(event_record_t{.event_id = next_event_id++,
                                        .height = height,
                                        .tx_index = static_cast<uint32_t>(i),
                                        .signer = maybe_tx->signer,
                                        .recorded_at = block_time,
                                        .event = event});
      }
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_block_time_ = block_time;
  pending_state_root_ = compute_state_root(rolling_hash, world);
  pending_world_ = std::move(world);
  pending_events_ = std::move(events);
  result.state_root = pending_state_root_;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  auto persisted = uint64_t{};
  if (pending_height_ > 0) {
    auto entries = std::vector<tessera::storage::key_value_entry_t>{};
    entries.reserve(pending_events_.size() + 1);
    entries.emplace_back(make_bytes(kWorldStateKey),
                         encoder_.encode(pending_world_));
    for (const auto& record : pending_events_) {
      entries.emplace_back(make_event_key(record.event_id),
                           encoder_.encode(record));
    }
    persisted = pending_events_.size();

    auto next_event_id = next_event_id_ + persisted;
    storage_.commit(
        tessera::storage::committed_state{.height = pending_height_,
                                          .state_root = pending_state_root_,
                                          .block_time = pending_block_time_,
                                          .next_event_id = next_event_id},
        entries);

    committed_world_ = std::move(pending_world_);
    pending_world_ = world_state_t{};
    pending_events_.clear();
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    last_block_time_ = pending_block_time_;
    next_event_id_ = next_event_id;
    pending_height_ = 0;
    spdlog::info("Committed height {} with {} event(s)", last_committed_height_,
                 persisted);
  }

  auto result = commit_result_t{};
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  result.events_persisted = persisted;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_time = last_block_time_;
  result.last_block_state_root = last_committed_state_root_;
  result.chain_id = committed_world_.chain_id;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  if (path == "/engine/info") {
    auto app = info();
    auto result = query_result_t{};
    result.key = make_bytes(path);
    result.value = encoder_.encode(app);
    result.height = app.last_block_height;
    return result;
  }
  if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range || std::get<0>(*range) > std::get<1>(*range)) {
      return make_query_error(query_error_code::invalid_key,
                              "expected (from_id, to_id) with from <= to",
                              info().last_block_height);
    }
    auto records = events(std::get<0>(*range), std::get<1>(*range));
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.value = encoder_.encode(records);
    result.height = info().last_block_height;
    return result;
  }

  auto lock = std::scoped_lock{mutex_};
  return query_state(path, data);
}

std::vector<event_record_t> engine::events(const uint64_t from_id,
                                           const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto last = std::min(to_id, from_id + kMaxEventsPerQuery - 1);
  auto first_key = make_event_key(from_id);
  auto last_key = make_event_key(last);
  auto records = std::vector<event_record_t>{};
  for (const auto& [key, value] :
       storage_.list_range(bytes_view_t{first_key}, bytes_view_t{last_key})) {
    auto record =
        encoder_.try_decode<event_record_t>(bytes_view_t{value});
    if (!record) {
      tessera::common::critical("failed to decode persisted event record");
    }
    records.push_back(std::move(*record));
  }
  return records;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

void engine::set_receive_hook(tessera::custody::receive_hook_t hook) {
  auto lock = std::scoped_lock{mutex_};
  receive_hook_ = std::move(hook);
}

std::optional<transaction_result_t> engine::validate_block(
    const uint64_t height,
    const timestamp_milliseconds_t block_time) const {
  const auto expected_height =
      static_cast<uint64_t>(last_committed_height_) + 1;
  if (height != expected_height) {
    return make_error_result(
        transaction_error_code::invalid_block_height, "invalid block height",
        fmt::format("expected height {}, got {}", expected_height, height),
        "tessera.finalize");
  }
  if (block_time < last_block_time_) {
    return make_error_result(
        transaction_error_code::invalid_block_time, "invalid block time",
        fmt::format("block time {} precedes last block time {}", block_time,
                    last_block_time_),
        "tessera.finalize");
  }
  return std::nullopt;
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const world_state_t& world,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1", codespace);
  }
  if (tx.chain_id != world.chain_id) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             "invalid chain id",
                             "transaction targets a different chain",
                             codespace);
  }
  if (tx.signer == tessera::custody::vault_address() ||
      tx.signer == tessera::custody::timelock_address()) {
    return make_error_result(transaction_error_code::reserved_signer,
                             "reserved signer",
                             "system accounts cannot sign transactions",
                             codespace);
  }
  auto expected_nonce = lookup(world.nonces, tx.signer).value_or(0) + 1;
  if (tx.nonce != expected_nonce) {
    return make_error_result(
        transaction_error_code::invalid_nonce, "invalid nonce",
        fmt::format("expected nonce {}", expected_nonce), codespace);
  }
  if (require_strict_crypto_) {
    auto message = signing_bytes(tx);
    if (!signature_verifier_ ||
        !signature_verifier_(bytes_view_t{message.data(), message.size()},
                             tx.signer, tx.signature)) {
      return make_error_result(
          transaction_error_code::signature_verification_failed,
          "signature verification failed",
          "ed25519 signature does not match signer", codespace);
    }
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_transaction(
    const transaction_t& tx,
    world_state_t& world,
    const timestamp_milliseconds_t block_time) {
  auto scratch = world;
  auto status = tessera::common::status_t{};
  auto events = std::vector<transaction_event_t>{};
  {
    auto runner = runtime{scratch, block_time, receive_hook_};
    status = runner.apply(tx.signer, tx.payload);
    events = runner.take_events();
  }

  const auto name = payload_name(tx.payload);
  if (status) {
    spdlog::debug("Rejected {} from {}: {}", name, to_hex(tx.signer),
                  status->reason);
    return make_error_result(
        status->code, status->reason,
        std::string{to_string(category_of(status->code))},
        codespace(tx.payload));
  }

  scratch.nonces[tx.signer] = tx.nonce;
  world = std::move(scratch);

  spdlog::debug("Applied {} from {} ({} event(s))", name, to_hex(tx.signer),
                events.size());
  auto result = transaction_result_t{};
  result.log = std::string{name};
  result.info = fmt::format("{} accepted", name);
  result.codespace = std::string{codespace(tx.payload)};
  result.events = std::move(events);
  return result;
}

hash32_t engine::compute_state_root(const hash32_t& rolling_hash,
                                    const world_state_t& world) {
  auto material = encoder_.encode(std::tuple{rolling_hash, world});
  return tessera::blake3::hash(bytes_view_t{material.data(), material.size()});
}

query_result_t engine::query_state(const std::string_view path,
                                   const bytes_view_t& data) const {
  const auto height = last_committed_height_;
  const auto& world = committed_world_;
  auto encoder = encoder_t{};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = height;

  auto found = [&](const auto& value) {
    result.value = encoder.encode(value);
    return result;
  };
  auto invalid = [&](const std::string_view expected) {
    return make_query_error(query_error_code::invalid_key,
                            fmt::format("expected {} key", expected), height);
  };
  auto missing = [&] {
    return make_query_error(query_error_code::not_found, "not found", height);
  };

  if (path == "/state/asset") {
    auto asset_id = encoder.try_decode<asset_id_t>(data);
    if (!asset_id) {
      return invalid("asset id");
    }
    auto record = lookup(world.custody.assets, *asset_id);
    return record ? found(*record) : missing();
  }
  if (path == "/state/auction") {
    auto asset_id = encoder.try_decode<asset_id_t>(data);
    if (!asset_id) {
      return invalid("asset id");
    }
    auto auction = lookup(world.auctions.auctions, *asset_id);
    return auction ? found(*auction) : missing();
  }
  if (path == "/state/pending") {
    auto account = encoder.try_decode<address_t>(data);
    if (!account) {
      return invalid("address");
    }
    return found(lookup(world.pending.owed, *account).value_or(0));
  }
  if (path == "/state/proposal") {
    auto proposal_id = encoder.try_decode<proposal_id_t>(data);
    if (!proposal_id) {
      return invalid("proposal id");
    }
    auto proposal = lookup(world.governance.proposals, *proposal_id);
    return proposal ? found(*proposal) : missing();
  }
  if (path == "/state/proposal_status") {
    auto proposal_id = encoder.try_decode<proposal_id_t>(data);
    if (!proposal_id) {
      return invalid("proposal id");
    }
    // Status is projected at the last committed block time.
    auto view = world;
    auto runner = runtime{view, last_block_time_};
    auto status = runner.governance().status(*proposal_id, last_block_time_);
    return status ? found(std::string{to_string(*status)}) : missing();
  }
  if (path == "/state/scheduled_call") {
    auto call_id = encoder.try_decode<call_id_t>(data);
    if (!call_id) {
      return invalid("call id");
    }
    auto call = lookup(world.timelock.calls, *call_id);
    return call ? found(*call) : missing();
  }
  if (path == "/state/fractions") {
    auto holder = encoder.try_decode<address_t>(data);
    if (!holder) {
      return invalid("address");
    }
    return found(std::tuple{lookup(world.fractions.balances, *holder)
                                .value_or(0),
                            world.fractions.total_supply});
  }
  if (path == "/state/balance") {
    auto account = encoder.try_decode<address_t>(data);
    if (!account) {
      return invalid("address");
    }
    return found(lookup(world.rail.balances, *account).value_or(0));
  }
  if (path == "/state/parameters") {
    return found(std::tuple{world.custody.parameters,
                            world.auctions.parameters,
                            world.governance.parameters,
                            world.custody.governance_authority});
  }
  return make_query_error(query_error_code::unsupported_path,
                          fmt::format("unsupported query path '{}'", path),
                          height);
}

void engine::load_persisted_state(const tessera::config::genesis_t& genesis) {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    auto world = storage_.get<world_state_t>(
        encoder_, make_bytes_view(kWorldStateKey));
    if (!world) {
      tessera::common::critical("committed state has no world state");
    }
    committed_world_ = std::move(*world);
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    last_block_time_ = committed->block_time;
    next_event_id_ = committed->next_event_id;
    if (committed_world_.chain_id != tessera::config::chain_id(genesis)) {
      spdlog::warn("Stored chain id differs from genesis '{}'; keeping stored",
                   genesis.chain_name);
    }
    return;
  }

  committed_world_ = tessera::config::make_world_state(genesis);
  last_committed_state_root_ =
      compute_state_root(make_zero_hash(), committed_world_);
  storage_.commit(
      tessera::storage::committed_state{
          .height = 0,
          .state_root = last_committed_state_root_,
          .block_time = 0,
          .next_event_id = next_event_id_},
      {{make_bytes(kWorldStateKey), encoder_.encode(committed_world_)}});
}

}  // namespace tessera::execution
