#include <blake3.h>
#include <tessera/blake3/hash.hpp>

namespace tessera::blake3 {

namespace {

tessera::schema::hash32_t digest(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = tessera::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<tessera::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

tessera::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

tessera::schema::hash32_t hash(const tessera::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace tessera::blake3
