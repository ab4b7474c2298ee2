#include <blake3.h>
#include <notary/blake3/hash.hpp>

namespace notary::blake3 {

namespace {

notary::schema::hash32_t hash_raw(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = notary::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<notary::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

notary::schema::hash32_t hash(const std::string_view& str) {
  return hash_raw(str.data(), str.size());
}

notary::schema::hash32_t hash(const notary::schema::bytes_view_t& bytes) {
  return hash_raw(bytes.data(), bytes.size());
}

}  // namespace notary::blake3
