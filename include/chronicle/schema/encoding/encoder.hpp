#pragma once
#include <chronicle/schema/primitives.hpp>
#include <optional>
#include <span>

namespace chronicle::schema::encoding {

// The wire format is a build time choice: callers name the library through
// a tag type and the specialization lives next to that library's headers.
template <typename Library>
struct encoder {
  template <typename T>
  chronicle::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, chronicle::schema::bytes_t& out);

  template <typename T>
  T decode(const chronicle::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const chronicle::schema::bytes_view_t& bytes);
};

}  // namespace chronicle::schema::encoding
