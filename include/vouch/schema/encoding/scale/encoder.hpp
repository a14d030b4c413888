#pragma once
#include <vouch/common/critical.hpp>
#include <vouch/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

// Records are plain aggregates; scale-codec decomposes them field by field,
// so no per-type codec is registered here.
namespace vouch::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  vouch::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, vouch::schema::bytes_t& out);

  template <typename T>
  T decode(const vouch::schema::bytes_view_t& bytes);
};

template <typename T>
vouch::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    vouch::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        vouch::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const vouch::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    vouch::common::critical("persisted record no longer decodes");
  }
  return decoded.value();
}

}  // namespace vouch::schema::encoding
