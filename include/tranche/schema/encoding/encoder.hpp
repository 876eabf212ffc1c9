#pragma once
#include <tranche/schema/primitives.hpp>
#include <optional>
#include <span>

namespace tranche::schema::encoding {

// The codec is a build time choice; swap the tag, not the call sites.
template <typename Library>
struct encoder {
  template <typename T>
  tranche::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, tranche::schema::bytes_t& out);

  template <typename T>
  std::optional<T> try_decode(const tranche::schema::bytes_view_t& bytes);
};

}  // namespace tranche::schema::encoding
