#pragma once

#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/primitives.hpp>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chronicle::execution {

class workflow_context;

using activity_fn_t = std::function<chronicle::schema::bytes_t(
    const chronicle::schema::bytes_t&)>;
using workflow_fn_t = std::function<chronicle::schema::bytes_t(
    workflow_context&,
    const chronicle::schema::bytes_t&)>;

namespace detail {

using encoder_t = chronicle::schema::encoding::encoder<
    chronicle::schema::encoding::scale_encoder_tag>;

template <typename T>
T decode_argument(const chronicle::schema::bytes_t& raw,
                  std::string_view name) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<T>(
      chronicle::schema::bytes_view_t{raw.data(), raw.size()});
  if (!decoded.has_value()) {
    throw std::invalid_argument{"input of '" + std::string{name} +
                                "' is not decodable"};
  }
  return std::move(decoded.value());
}

}  // namespace detail

/// Activities by step name. Built before the engine and handed to it whole.
class activity_registry final {
 public:
  activity_registry& add(std::string name, activity_fn_t activity) {
    activities_.insert_or_assign(std::move(name), std::move(activity));
    return *this;
  }

  /// Register `Result fn(const Input&)`; values travel SCALE encoded.
  template <typename Result, typename Input, typename Fn>
  activity_registry& add_typed(std::string name, Fn fn) {
    auto label = name;
    return add(std::move(name),
               [fn = std::move(fn), label = std::move(label)](
                   const chronicle::schema::bytes_t& raw) {
                 auto input = detail::decode_argument<Input>(raw, label);
                 auto encoder = detail::encoder_t{};
                 return encoder.encode(Result{fn(input)});
               });
  }

  const activity_fn_t* find(std::string_view name) const {
    auto found = activities_.find(name);
    return found == std::end(activities_) ? nullptr : &found->second;
  }

  std::vector<std::string> names() const {
    auto out = std::vector<std::string>{};
    out.reserve(activities_.size());
    for (const auto& [name, activity] : activities_) {
      out.push_back(name);
    }
    return out;
  }

 private:
  std::map<std::string, activity_fn_t, std::less<>> activities_;
};

/// Workflow functions by type name; a persisted record names its type so a
/// restarted process can resume it.
class workflow_registry final {
 public:
  workflow_registry& add(std::string type, workflow_fn_t workflow) {
    workflows_.insert_or_assign(std::move(type), std::move(workflow));
    return *this;
  }

  /// Register `Result fn(workflow_context&, const Args&)`.
  template <typename Result, typename Args, typename Fn>
  workflow_registry& add_typed(std::string type, Fn fn) {
    auto label = type;
    return add(std::move(type),
               [fn = std::move(fn), label = std::move(label)](
                   workflow_context& context,
                   const chronicle::schema::bytes_t& raw) {
                 auto args = detail::decode_argument<Args>(raw, label);
                 auto encoder = detail::encoder_t{};
                 return encoder.encode(Result{fn(context, args)});
               });
  }

  const workflow_fn_t* find(std::string_view type) const {
    auto found = workflows_.find(type);
    return found == std::end(workflows_) ? nullptr : &found->second;
  }

  std::vector<std::string> types() const {
    auto out = std::vector<std::string>{};
    out.reserve(workflows_.size());
    for (const auto& [type, workflow] : workflows_) {
      out.push_back(type);
    }
    return out;
  }

 private:
  std::map<std::string, workflow_fn_t, std::less<>> workflows_;
};

}  // namespace chronicle::execution
