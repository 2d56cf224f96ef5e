#pragma once

#include <gtest/gtest.h>

#include <tessera/encoding/scale/encoder.hpp>
#include <tessera/execution/engine.hpp>
#include <tessera/schema/app_info.hpp>
#include <tessera/schema/event_record.hpp>
#include <tessera/schema/transaction.hpp>
#include <tessera/testing/common.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <tuple>
#include <vector>

namespace tessera::testing {

using scale_encoder_t = tessera::encoding::scale_encoder_t;

inline tessera::schema::transaction_t make_transaction(
    const tessera::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const tessera::schema::address_t& signer,
    const tessera::schema::transaction_payload_t& payload) {
  return tessera::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = tessera::schema::ed25519_signature_t{}};
}

inline tessera::schema::bytes_t encode_transaction(
    const tessera::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

inline tessera::schema::app_info_t query_info(
    tessera::execution::engine& engine) {
  const auto query = engine.query("/engine/info", {});
  EXPECT_EQ(query.code, 0u);
  auto encoder = scale_encoder_t{};
  return encoder.decode<tessera::schema::app_info_t>(
      tessera::schema::bytes_view_t{query.value.data(), query.value.size()});
}

inline tessera::schema::hash32_t chain_id_from_engine(
    tessera::execution::engine& engine) {
  return query_info(engine).chain_id;
}

/// Decode the value of a successful state query.
template <typename T, typename Key>
T query_value(tessera::execution::engine& engine,
              const std::string_view path,
              const Key& key) {
  auto encoder = scale_encoder_t{};
  const auto encoded_key = encoder.encode(key);
  const auto result = engine.query(
      path, tessera::schema::bytes_view_t{encoded_key.data(),
                                          encoded_key.size()});
  EXPECT_EQ(result.code, 0u) << result.log;
  return encoder.decode<T>(
      tessera::schema::bytes_view_t{result.value.data(), result.value.size()});
}

/// Decode the value of a successful query on a route that takes no key.
template <typename T>
T query_value(tessera::execution::engine& engine, const std::string_view path) {
  auto encoder = scale_encoder_t{};
  const auto result = engine.query(path, {});
  EXPECT_EQ(result.code, 0u) << result.log;
  return encoder.decode<T>(
      tessera::schema::bytes_view_t{result.value.data(), result.value.size()});
}

inline std::vector<tessera::schema::event_record_t> query_events(
    tessera::execution::engine& engine,
    const uint64_t from_id,
    const uint64_t to_id) {
  return query_value<std::vector<tessera::schema::event_record_t>>(
      engine, "/events/range", std::tuple{from_id, to_id});
}

/// Drives one engine block by block, tracking per-signer nonces.
class block_driver final {
 public:
  explicit block_driver(tessera::execution::engine& engine)
      : engine_{engine},
        chain_id_{chain_id_from_engine(engine)},
        height_{static_cast<uint64_t>(query_info(engine).last_block_height)} {}

  /// Run `payload` alone in the next block at `block_time` and commit.
  tessera::schema::transaction_result_t submit(
      const tessera::schema::address_t& signer,
      const tessera::schema::transaction_payload_t& payload,
      const tessera::schema::timestamp_milliseconds_t block_time) {
    auto& nonce = nonces_[signer];
    auto tx = make_transaction(chain_id_, nonce + 1, signer, payload);
    auto block =
        engine_.finalize_block(++height_, block_time, {encode_transaction(tx)});
    EXPECT_EQ(block.tx_results.size(), 1u);
    auto result = block.tx_results.front();
    if (result.code == 0) {
      ++nonce;
    }
    last_state_root_ = engine_.commit().state_root;
    return result;
  }

  uint64_t next_nonce(const tessera::schema::address_t& signer) {
    return nonces_[signer] + 1;
  }

  const tessera::schema::hash32_t& chain_id() const { return chain_id_; }
  uint64_t height() const { return height_; }
  const tessera::schema::hash32_t& last_state_root() const {
    return last_state_root_;
  }

 private:
  tessera::execution::engine& engine_;
  tessera::schema::hash32_t chain_id_;
  uint64_t height_{};
  std::map<tessera::schema::address_t, uint64_t> nonces_;
  tessera::schema::hash32_t last_state_root_{};
};

}  // namespace tessera::testing
