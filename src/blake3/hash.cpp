#include <blake3.h>
#include <vouch/blake3/hash.hpp>

namespace vouch::blake3 {

namespace {

struct hasher final {
  blake3_hasher state{};

  hasher() { blake3_hasher_init(&state); }

  void update(const void* data, std::size_t size) {
    blake3_hasher_update(&state, data, size);
  }

  vouch::schema::hash32_t finalize() {
    static_assert(BLAKE3_OUT_LEN == 32);
    auto output = vouch::schema::hash32_t{};
    blake3_hasher_finalize(&state, output.data(), output.size());
    return output;
  }
};

}  // namespace

vouch::schema::hash32_t hash(const std::string_view& str) {
  auto h = hasher{};
  h.update(str.data(), str.size());
  return h.finalize();
}

vouch::schema::hash32_t hash(const vouch::schema::bytes_view_t& bytes) {
  auto h = hasher{};
  h.update(bytes.data(), bytes.size());
  return h.finalize();
}

vouch::schema::hash32_t hash(
    std::initializer_list<vouch::schema::bytes_view_t> parts) {
  auto h = hasher{};
  for (const auto& part : parts) {
    h.update(part.data(), part.size());
  }
  return h.finalize();
}

}  // namespace vouch::blake3
