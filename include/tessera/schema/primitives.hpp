#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = hash32_t;  // ed25519 public key of the account
using asset_id_t = uint64_t;
using proposal_id_t = uint64_t;
using call_id_t = uint64_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

using ed25519_signature_t = std::array<uint8_t, 64>;

inline constexpr auto kMinuteMilliseconds = duration_milliseconds_t{60'000};
inline constexpr auto kHourMilliseconds = 60 * kMinuteMilliseconds;
inline constexpr auto kDayMilliseconds = 24 * kHourMilliseconds;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_zero_hash();
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
std::optional<amount_t> try_make_amount(const std::string_view& decimal);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::string to_string(const amount_t& amount);

}  // namespace tessera::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
