#pragma once

#include <chronicle/execution/workflow_context.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace chronicle::testing {

using scale_encoder_t = chronicle::schema::encoding::encoder<
    chronicle::schema::encoding::scale_encoder_tag>;

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Clock that only moves when a test moves it.
class manual_clock final {
 public:
  explicit manual_clock(
      const chronicle::schema::timestamp_milliseconds_t start = 1'000'000)
      : now_{start} {}

  chronicle::schema::timestamp_milliseconds_t now() const { return now_; }

  void advance(const chronicle::schema::duration_milliseconds_t amount) {
    now_ += amount;
  }

  void set(const chronicle::schema::timestamp_milliseconds_t value) {
    now_ = value;
  }

  chronicle::execution::clock_fn_t function() {
    return [this]() { return now_.load(); };
  }

 private:
  std::atomic<chronicle::schema::timestamp_milliseconds_t> now_;
};

template <typename T>
chronicle::schema::bytes_t encode(const T& value) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(value);
}

template <typename T>
T decode(const chronicle::schema::bytes_t& bytes) {
  auto encoder = scale_encoder_t{};
  return encoder.decode<T>(
      chronicle::schema::bytes_view_t{bytes.data(), bytes.size()});
}

}  // namespace chronicle::testing
