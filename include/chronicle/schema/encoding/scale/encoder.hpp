#pragma once
#include <chronicle/common/critical.hpp>
#include <chronicle/schema/encoding/encoder.hpp>
#include <chronicle/schema/history_entry.hpp>
#include <chronicle/schema/signal_wait.hpp>
#include <chronicle/schema/timer_input.hpp>
#include <chronicle/schema/workflow_record.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace chronicle::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  chronicle::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, chronicle::schema::bytes_t& out);

  template <typename T>
  T decode(const chronicle::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const chronicle::schema::bytes_view_t& bytes);
};

template <typename T>
chronicle::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    chronicle::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        chronicle::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const chronicle::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    chronicle::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const chronicle::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace chronicle::schema::encoding
