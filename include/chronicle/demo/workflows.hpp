#pragma once

#include <chronicle/execution/registry.hpp>
#include <chronicle/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Sample workflows served by chronicled. Every workflow takes a SCALE
// encoded std::string argument.
namespace chronicle::demo {

inline constexpr auto kNotifyRounds = uint32_t{3};
inline constexpr auto kNotifyPause = chronicle::schema::duration_milliseconds_t{3000};
inline constexpr auto kSumPause = chronicle::schema::duration_milliseconds_t{1000};
inline constexpr auto kInvoiceSignal = std::string_view{"invoice.send"};
inline constexpr auto kMillisecondsPerDay =
    chronicle::schema::duration_milliseconds_t{24 * 60 * 60 * 1000};
inline constexpr auto kReminderDays = std::array{1, 7, 14, 28};

/// Parse "1, 2,3" into integers; throws std::invalid_argument on bad input.
std::vector<int64_t> parse_terms(std::string_view text);

/// Register the sample activities and workflows.
void register_demo(chronicle::execution::activity_registry& activities,
                   chronicle::execution::workflow_registry& workflows);

/// SCALE encode a workflow argument.
chronicle::schema::bytes_t encode_args(const std::string& args);

/// Render the output of a completed sample workflow for the console.
std::string format_output(std::string_view workflow_type,
                          const chronicle::schema::bytes_t& output);

}  // namespace chronicle::demo
