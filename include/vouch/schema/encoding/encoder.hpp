#pragma once
#include <vouch/schema/primitives.hpp>

namespace vouch::schema::encoding {

/// Codec selected at build time by tag, e.g. `encoder<scale_encoder_tag>`.
template <typename Library>
struct encoder {
  template <typename T>
  vouch::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, vouch::schema::bytes_t& out);

  template <typename T>
  T decode(const vouch::schema::bytes_view_t& bytes);
};

}  // namespace vouch::schema::encoding
