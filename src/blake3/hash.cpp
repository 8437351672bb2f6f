#include <blake3.h>
#include <reina/blake3/hash.hpp>

namespace reina::blake3 {

namespace {

reina::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = reina::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

reina::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

reina::schema::hash32_t hash(const reina::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace reina::blake3
