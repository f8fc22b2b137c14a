#pragma once
#include <verity/schema/primitives.hpp>
#include <optional>
#include <span>

namespace verity::schema::encoding {

// Encoding backend is selected at build time by tag; hot swapping is not a
// goal. Storage, keys and the engine are written against this interface.
template <typename Library>
struct encoder {
  template <typename T>
  verity::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, verity::schema::bytes_t& out);

  template <typename T>
  T decode(const verity::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const verity::schema::bytes_view_t& bytes);
};

}  // namespace verity::schema::encoding
