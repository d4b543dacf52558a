#include <spdlog/spdlog.h>
#include <charconv>
#include <chronicle/demo/workflows.hpp>
#include <chronicle/execution/workflow_context.hpp>
#include <numeric>
#include <stdexcept>

using namespace chronicle::schema;
using namespace chronicle::execution;

namespace {

using encoder_t = chronicle::schema::encoding::encoder<
    chronicle::schema::encoding::scale_encoder_tag>;

std::string_view trim(std::string_view value) {
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.remove_prefix(1);
  }
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
    value.remove_suffix(1);
  }
  return value;
}

uint32_t notify(workflow_context& context, const std::string& recipient) {
  auto delivered = uint32_t{};
  for (auto round = uint32_t{}; round < chronicle::demo::kNotifyRounds;
       ++round) {
    auto message = "round " + std::to_string(round + 1) + " for " + recipient;
    if (context.call<bool, std::string>("send_message", message)) {
      ++delivered;
    }
    context.sleep(chronicle::demo::kNotifyPause);
  }
  return delivered;
}

int64_t sum(workflow_context& context, const std::string& text) {
  auto terms = chronicle::demo::parse_terms(text);
  auto total = context.call<int64_t, std::vector<int64_t>>("sum", terms);
  context.sleep(chronicle::demo::kSumPause);
  return total;
}

// Deadlines count from the workflow's first recorded clock reading, so a
// resumed pass waits only for what is left of each period.
std::string reminder(workflow_context& context, const std::string& email) {
  const auto started_at = context.now();
  auto sent = uint32_t{};
  for (const auto day : chronicle::demo::kReminderDays) {
    const auto deadline =
        started_at + static_cast<duration_milliseconds_t>(day) *
                         chronicle::demo::kMillisecondsPerDay;
    const auto now = context.now();
    const auto timeout = deadline > now ? deadline - now : 0;
    auto payload =
        context.wait_for_signal(chronicle::demo::kInvoiceSignal, timeout);
    if (payload.has_value()) {
      return "invoice received from " + email + ": " + make_string(*payload);
    }
    context.call<bool, std::string>("send_reminder_email", email);
    ++sent;
  }
  return "no invoice from " + email + " after " + std::to_string(sent) +
         " reminder(s)";
}

}  // namespace

namespace chronicle::demo {

std::vector<int64_t> parse_terms(std::string_view text) {
  auto terms = std::vector<int64_t>{};
  while (!text.empty()) {
    auto comma = text.find(',');
    auto token = trim(text.substr(0, comma));
    text = comma == std::string_view::npos ? std::string_view{}
                                           : text.substr(comma + 1);
    if (token.empty()) {
      continue;
    }
    auto value = int64_t{};
    auto [end, error] =
        std::from_chars(token.data(), token.data() + token.size(), value);
    if (error != std::errc{} || end != token.data() + token.size()) {
      throw std::invalid_argument{"'" + std::string{token} +
                                  "' is not an integer"};
    }
    terms.push_back(value);
  }
  return terms;
}

void register_demo(activity_registry& activities,
                   workflow_registry& workflows) {
  activities
      .add_typed<bool, std::string>("send_message",
                                    [](const std::string& message) {
                                      spdlog::info("Sending message: {}",
                                                   message);
                                      return true;
                                    })
      .add_typed<int64_t, std::vector<int64_t>>(
          "sum",
          [](const std::vector<int64_t>& terms) {
            return std::accumulate(std::begin(terms), std::end(terms),
                                   int64_t{});
          })
      .add_typed<bool, std::string>(
          "send_reminder_email", [](const std::string& email) {
            spdlog::info("Reminding {} to send their invoice", email);
            return true;
          });

  workflows.add_typed<uint32_t, std::string>("notify", notify)
      .add_typed<int64_t, std::string>("sum", sum)
      .add_typed<std::string, std::string>("reminder", reminder);
}

bytes_t encode_args(const std::string& args) {
  auto encoder = encoder_t{};
  return encoder.encode(args);
}

std::string format_output(std::string_view workflow_type,
                          const bytes_t& output) {
  auto encoder = encoder_t{};
  auto view = bytes_view_t{output.data(), output.size()};
  if (workflow_type == "notify") {
    if (auto value = encoder.try_decode<uint32_t>(view)) {
      return std::to_string(*value) + " message(s) delivered";
    }
  } else if (workflow_type == "sum") {
    if (auto value = encoder.try_decode<int64_t>(view)) {
      return "total " + std::to_string(*value);
    }
  } else if (workflow_type == "reminder") {
    if (auto value = encoder.try_decode<std::string>(view)) {
      return *value;
    }
  }
  return to_hex(view);
}

}  // namespace chronicle::demo
