#include <chronicle/demo/workflows.hpp>
#include <chronicle/testing/common.hpp>
#include <chronicle/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

using chronicle::testing::engine_fixture;

engine_fixture::setup_fn_t demo_setup() {
  return [](chronicle::execution::activity_registry& activities,
            chronicle::execution::workflow_registry& workflows) {
    chronicle::demo::register_demo(activities, workflows);
  };
}

std::string describe_output(const std::string& type,
                            const chronicle::schema::run_result_t& result) {
  const auto* completed = std::get_if<chronicle::schema::completed_t>(&result);
  if (completed == nullptr) {
    return chronicle::schema::to_string(result);
  }
  return chronicle::demo::format_output(type, completed->output);
}

}  // namespace

TEST(demo_workflows, parse_terms_reads_comma_separated_integers) {
  EXPECT_EQ(chronicle::demo::parse_terms("1, 2,3"),
            (std::vector<int64_t>{1, 2, 3}));
  EXPECT_EQ(chronicle::demo::parse_terms(" -4 ,,10 "),
            (std::vector<int64_t>{-4, 10}));
  EXPECT_TRUE(chronicle::demo::parse_terms("").empty());
  EXPECT_THROW(chronicle::demo::parse_terms("1,two"), std::invalid_argument);
}

TEST(demo_workflows, sum_adds_terms_after_a_pause) {
  auto fixture = engine_fixture{"chronicle_demo_sum", demo_setup()};
  auto& engine = fixture.engine();

  auto first = engine.start_workflow("sum-1", "sum",
                                     chronicle::demo::encode_args("1,2,3,4"));
  ASSERT_TRUE(chronicle::schema::is_suspended(first));

  fixture.clock().advance(chronicle::demo::kSumPause);
  EXPECT_EQ(describe_output("sum", engine.resume_workflow("sum-1")),
            "total 10");
}

TEST(demo_workflows, bad_sum_input_fails_the_workflow) {
  auto fixture = engine_fixture{"chronicle_demo_bad_sum", demo_setup()};

  auto result = fixture.engine().start_workflow(
      "sum-1", "sum", chronicle::demo::encode_args("1,x"));

  ASSERT_TRUE(chronicle::schema::is_failed(result));
  EXPECT_EQ(std::get<chronicle::schema::failed_t>(result).code,
            chronicle::schema::workflow_error_code_t::workflow_error);
}

TEST(demo_workflows, notify_sends_every_round) {
  auto fixture = engine_fixture{"chronicle_demo_notify", demo_setup()};
  auto& engine = fixture.engine();

  auto result = engine.start_workflow("notify-1", "notify",
                                      chronicle::demo::encode_args("alice"));
  auto passes = 1u;
  while (chronicle::schema::is_suspended(result)) {
    ASSERT_LE(passes, chronicle::demo::kNotifyRounds);
    fixture.clock().advance(chronicle::demo::kNotifyPause);
    result = engine.resume_workflow("notify-1");
    ++passes;
  }

  EXPECT_EQ(describe_output("notify", result), "3 message(s) delivered");
  EXPECT_EQ(engine.history("notify-1").size(),
            2u * chronicle::demo::kNotifyRounds);
}

TEST(demo_workflows, reminder_nags_until_invoice_arrives) {
  auto fixture = engine_fixture{"chronicle_demo_reminder", demo_setup()};
  auto& engine = fixture.engine();
  const auto started_at = fixture.clock().now();
  const auto day = chronicle::demo::kMillisecondsPerDay;

  auto first = engine.start_workflow(
      "rem-1", "reminder", chronicle::demo::encode_args("a@example.com"));
  ASSERT_TRUE(chronicle::schema::is_suspended(first));
  EXPECT_EQ(std::get<chronicle::schema::suspended_t>(first).wake_at,
            std::optional{started_at + day});

  fixture.clock().advance(day);
  auto second = engine.resume_workflow("rem-1");
  ASSERT_TRUE(chronicle::schema::is_suspended(second));
  EXPECT_EQ(std::get<chronicle::schema::suspended_t>(second).wake_at,
            std::optional{started_at + 7 * day});

  auto history = engine.history("rem-1");
  auto reminders = 0;
  for (const auto& entry : history) {
    if (entry.step_name == "send_reminder_email") {
      ++reminders;
    }
  }
  EXPECT_EQ(reminders, 1);

  auto done = engine.signal_workflow(
      "rem-1", chronicle::demo::kInvoiceSignal,
      chronicle::schema::make_bytes(std::string{"INV-7"}));
  EXPECT_EQ(describe_output("reminder", done),
            "invoice received from a@example.com: INV-7");
}

TEST(demo_workflows, reminder_gives_up_after_last_deadline) {
  auto fixture = engine_fixture{"chronicle_demo_reminder_expired", demo_setup()};
  auto& engine = fixture.engine();

  auto result = engine.start_workflow(
      "rem-1", "reminder", chronicle::demo::encode_args("b@example.com"));
  fixture.clock().advance(28 * chronicle::demo::kMillisecondsPerDay);
  result = engine.resume_workflow("rem-1");

  EXPECT_EQ(describe_output("reminder", result),
            "no invoice from b@example.com after 4 reminder(s)");
}
