#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/timer_input.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <chronicle/storage/storage.hpp>
#include <chronicle/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace {

using storage_t =
    chronicle::storage::storage<chronicle::storage::rocksdb_storage_tag>;

chronicle::schema::workflow_record_t make_record(const std::string& id) {
  auto record = chronicle::schema::workflow_record_t{};
  record.workflow_id = id;
  record.workflow_type = "notify";
  record.status = chronicle::schema::workflow_status_t::suspended;
  record.args = chronicle::testing::encode(std::string{"alice"});
  record.history.push_back(chronicle::schema::history_entry_t{
      .workflow_id = id,
      .sequence = 0,
      .step_name = "send_message",
      .kind = chronicle::schema::step_kind_t::activity,
      .status = chronicle::schema::step_status_t::completed,
      .input = chronicle::schema::bytes_t{0x01},
      .output = chronicle::schema::bytes_t{0x02}});
  record.history.push_back(chronicle::schema::history_entry_t{
      .workflow_id = id,
      .sequence = 1,
      .step_name = std::string{chronicle::schema::kTimerStepName},
      .kind = chronicle::schema::step_kind_t::timer,
      .status = chronicle::schema::step_status_t::completed,
      .input = chronicle::testing::encode(chronicle::schema::timer_input_t{
          .started_at = 10, .wake_at = 3010})});
  record.inbox.push_back(chronicle::schema::pending_signal_t{
      .name = "invoice.send",
      .payload = chronicle::schema::bytes_t{0x07},
      .received_at = 99});
  return record;
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto entry = chronicle::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
  auto store = storage_t{};
  EXPECT_FALSE(store.database);
}

TEST(storage_types, workflow_record_round_trips) {
  auto db = chronicle::testing::make_db_path("chronicle_storage_record");
  {
    auto storage = chronicle::storage::make_storage<
        chronicle::storage::rocksdb_storage_tag>(db);
    auto record = make_record("wf-1");
    ASSERT_TRUE(storage.save_workflow(record));

    auto loaded = storage.load_workflow("wf-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->workflow_type, "notify");
    EXPECT_EQ(loaded->status, chronicle::schema::workflow_status_t::suspended);
    EXPECT_EQ(loaded->args, record.args);
    ASSERT_EQ(loaded->history.size(), 2u);
    EXPECT_EQ(loaded->history[0].step_name, "send_message");
    EXPECT_EQ(loaded->history[0].output,
              std::optional{chronicle::schema::bytes_t{0x02}});
    EXPECT_EQ(loaded->history[1].kind, chronicle::schema::step_kind_t::timer);
    EXPECT_FALSE(loaded->history[1].output.has_value());
    auto timer = chronicle::testing::decode<chronicle::schema::timer_input_t>(
        loaded->history[1].input);
    EXPECT_EQ(timer.wake_at, 3010u);
    ASSERT_EQ(loaded->inbox.size(), 1u);
    EXPECT_EQ(loaded->inbox[0].name, "invoice.send");
    EXPECT_EQ(loaded->inbox[0].received_at, 99u);

    EXPECT_FALSE(storage.load_workflow("missing").has_value());
  }
  chronicle::testing::remove_path(db);
}

TEST(storage_types, save_overwrites_previous_record) {
  auto db = chronicle::testing::make_db_path("chronicle_storage_overwrite");
  {
    auto storage = chronicle::storage::make_storage<
        chronicle::storage::rocksdb_storage_tag>(db);
    auto record = make_record("wf-1");
    ASSERT_TRUE(storage.save_workflow(record));
    record.status = chronicle::schema::workflow_status_t::completed;
    record.result = chronicle::schema::bytes_t{0x2A};
    ASSERT_TRUE(storage.save_workflow(record));

    auto loaded = storage.load_workflow("wf-1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->status, chronicle::schema::workflow_status_t::completed);
    EXPECT_EQ(loaded->result, std::optional{chronicle::schema::bytes_t{0x2A}});
    EXPECT_EQ(storage.load_workflows().size(), 1u);
  }
  chronicle::testing::remove_path(db);
}

TEST(storage_types, batch_save_and_load_all) {
  auto db = chronicle::testing::make_db_path("chronicle_storage_batch");
  {
    auto storage = chronicle::storage::make_storage<
        chronicle::storage::rocksdb_storage_tag>(db);
    ASSERT_TRUE(storage.save_workflows(
        {make_record("a"), make_record("b"), make_record("c")}));

    auto all = storage.load_workflows();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_TRUE(all.contains("a"));
    EXPECT_TRUE(all.contains("b"));
    EXPECT_TRUE(all.contains("c"));
    EXPECT_EQ(all.at("b").workflow_id, "b");

    auto prefix = chronicle::schema::make_bytes(std::string_view{"WF|REC|"});
    EXPECT_EQ(storage.list_by_prefix(chronicle::schema::make_bytes_view(prefix))
                  .size(),
              3u);
  }
  chronicle::testing::remove_path(db);
}

TEST(storage_types, remove_deletes_record) {
  auto db = chronicle::testing::make_db_path("chronicle_storage_remove");
  {
    auto storage = chronicle::storage::make_storage<
        chronicle::storage::rocksdb_storage_tag>(db);
    ASSERT_TRUE(storage.save_workflow(make_record("gone")));
    EXPECT_TRUE(storage.remove_workflow("gone"));
    EXPECT_FALSE(storage.load_workflow("gone").has_value());
    EXPECT_TRUE(storage.remove_workflow("never-saved"));
  }
  chronicle::testing::remove_path(db);
}

TEST(storage_types, records_survive_reopen) {
  auto db = chronicle::testing::make_db_path("chronicle_storage_reopen");
  {
    auto storage = chronicle::storage::make_storage<
        chronicle::storage::rocksdb_storage_tag>(db);
    ASSERT_TRUE(storage.save_workflow(make_record("durable")));
  }
  {
    auto storage = chronicle::storage::make_storage<
        chronicle::storage::rocksdb_storage_tag>(db);
    auto loaded = storage.load_workflow("durable");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->history.size(), 2u);
  }
  chronicle::testing::remove_path(db);
}

TEST(storage_types, read_only_store_rejects_writes) {
  auto db = chronicle::testing::make_db_path("chronicle_storage_read_only");
  {
    auto storage = chronicle::storage::make_storage<
        chronicle::storage::rocksdb_storage_tag>(db);
    ASSERT_TRUE(storage.save_workflow(make_record("kept")));
  }
  {
    auto storage = chronicle::storage::make_read_only_storage<
        chronicle::storage::rocksdb_storage_tag>(db);
    auto record = make_record("kept");
    record.status = chronicle::schema::workflow_status_t::completed;
    EXPECT_FALSE(storage.save_workflow(record));
    EXPECT_FALSE(storage.remove_workflow("kept"));

    auto loaded = storage.load_workflow("kept");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->status, chronicle::schema::workflow_status_t::suspended);
  }
  chronicle::testing::remove_path(db);
}

TEST(storage_types, corrupt_record_stops_loading) {
  auto db = chronicle::testing::make_db_path("chronicle_storage_corrupt");
  {
    auto storage = chronicle::storage::make_storage<
        chronicle::storage::rocksdb_storage_tag>(db);
    ASSERT_TRUE(storage.save_workflow(make_record("good")));
    auto status = storage.database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                                        "WF|REC|x", "\xFF\xFF garbage");
    ASSERT_TRUE(status.ok());

    EXPECT_DEATH(storage.load_workflows(), "");
    EXPECT_DEATH(storage.load_workflow("x"), "");
    EXPECT_TRUE(storage.load_workflow("good").has_value());
  }
  chronicle::testing::remove_path(db);
}
