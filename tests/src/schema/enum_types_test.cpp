#include <gtest/gtest.h>
#include <chronicle/schema/history_entry.hpp>
#include <chronicle/schema/run_result.hpp>
#include <chronicle/schema/step_kind.hpp>
#include <chronicle/schema/step_status.hpp>
#include <chronicle/schema/workflow_error_code.hpp>
#include <chronicle/schema/workflow_record.hpp>
#include <chronicle/schema/workflow_status.hpp>

TEST(enum_types, workflow_status_strings_map_both_ways) {
  using chronicle::schema::workflow_status_t;
  for (auto status :
       {workflow_status_t::not_started, workflow_status_t::running,
        workflow_status_t::suspended, workflow_status_t::completed,
        workflow_status_t::failed, workflow_status_t::cancelled}) {
    auto name = chronicle::schema::to_string(status);
    auto parsed =
        chronicle::schema::try_from_string<workflow_status_t>(name);
    ASSERT_TRUE(parsed.has_value()) << name;
    EXPECT_EQ(*parsed, status);
  }
  EXPECT_FALSE(chronicle::schema::try_from_string<workflow_status_t>("asleep")
                   .has_value());
}

TEST(enum_types, only_final_statuses_are_terminal) {
  using chronicle::schema::workflow_status_t;
  EXPECT_FALSE(chronicle::schema::is_terminal(workflow_status_t::not_started));
  EXPECT_FALSE(chronicle::schema::is_terminal(workflow_status_t::running));
  EXPECT_FALSE(chronicle::schema::is_terminal(workflow_status_t::suspended));
  EXPECT_TRUE(chronicle::schema::is_terminal(workflow_status_t::completed));
  EXPECT_TRUE(chronicle::schema::is_terminal(workflow_status_t::failed));
  EXPECT_TRUE(chronicle::schema::is_terminal(workflow_status_t::cancelled));
}

TEST(enum_types, step_kind_and_status_names) {
  EXPECT_EQ(chronicle::schema::to_string(chronicle::schema::step_kind_t::timer),
            "timer");
  EXPECT_EQ(chronicle::schema::to_string(
                chronicle::schema::step_kind_t::signal_received),
            "signal-received");
  EXPECT_EQ(chronicle::schema::to_string(
                chronicle::schema::step_status_t::completed),
            "completed");
  EXPECT_EQ(chronicle::schema::kTimerStepName, "sleep");
}

TEST(enum_types, defaults_are_stable) {
  auto entry = chronicle::schema::history_entry_t{};
  EXPECT_EQ(entry.version, 1u);
  EXPECT_EQ(entry.sequence, 0u);
  EXPECT_EQ(entry.status, chronicle::schema::step_status_t::running);
  EXPECT_FALSE(entry.output.has_value());

  auto record = chronicle::schema::workflow_record_t{};
  EXPECT_EQ(record.status, chronicle::schema::workflow_status_t::not_started);
  EXPECT_EQ(record.error_code, chronicle::schema::workflow_error_code_t::none);
  EXPECT_TRUE(record.history.empty());
  EXPECT_TRUE(record.inbox.empty());
}

TEST(enum_types, run_result_describes_itself) {
  auto suspended = chronicle::schema::run_result_t{
      chronicle::schema::suspended_t{.wake_at = 42}};
  EXPECT_TRUE(chronicle::schema::is_suspended(suspended));
  EXPECT_EQ(chronicle::schema::to_string(suspended), "suspended until 42");

  auto failed = chronicle::schema::run_result_t{chronicle::schema::failed_t{
      .code = chronicle::schema::workflow_error_code_t::determinism_violation,
      .message = "mismatch"}};
  EXPECT_TRUE(chronicle::schema::is_failed(failed));
  EXPECT_EQ(chronicle::schema::to_string(failed),
            "failed [determinism_violation]: mismatch");
}
