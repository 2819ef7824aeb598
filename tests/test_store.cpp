#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include "../include/errors.hpp"
#include "../include/store/keys.hpp"
#include "../include/store/result_store.hpp"
#include "test_helpers.hpp"

using namespace tokbench;
using namespace tokbench::store;
using tokbench::testing::TempDir;

namespace {

ResultStore::ShardCommit make_commit(const std::string& tokenizer, ShardRange shard, uint64_t first,
                                     uint64_t count, uint64_t hits = 1, uint64_t tokens = 2) {
    ResultStore::ShardCommit commit;
    commit.language = "ur";
    commit.tokenizer_id = tokenizer;
    commit.shard = shard;
    for (uint64_t offset = first; offset < first + count; ++offset) {
        commit.records.emplace_back(offset, StoredRecord{hits, tokens, RecordStatus::Scored});
    }
    return commit;
}

ShardPlan single_shard(uint64_t total) {
    return plan_shards(total, 1);
}

uint64_t count_records(const ResultStore& store, const std::string& tokenizer, uint64_t last) {
    uint64_t count = 0;
    store.snapshot().for_each_record("ur", tokenizer, 0, last,
                                     [&count](uint64_t, const StoredRecord&) { ++count; });
    return count;
}

} // namespace

TEST(ShardPlanTest, SplitsIntoContiguousShards) {
    ShardPlan plan = plan_shards(10, 3);
    ASSERT_EQ(plan.shards.size(), 3u);
    EXPECT_EQ(plan.shards[0], (ShardRange{0, 4}));
    EXPECT_EQ(plan.shards[1], (ShardRange{4, 7}));
    EXPECT_EQ(plan.shards[2], (ShardRange{7, 10}));
    EXPECT_EQ(plan.total_sentences(), 10u);

    EXPECT_EQ(plan_shards(2, 5).shards.size(), 2u);
    EXPECT_TRUE(plan_shards(0, 4).shards.empty());
    EXPECT_EQ(plan_shards(7, 0).shards.size(), 1u);
}

TEST(StoreKeysTest, RecordKeysSortByOffset) {
    EXPECT_LT(record_key("ur", "rule", 1), record_key("ur", "rule", 256));
    EXPECT_LT(record_key("ur", "rule", 255), record_key("ur", "rule", 65536));

    DecodedKey key = decode_key(record_key("zh", "icu", 12345));
    EXPECT_EQ(key.kind, KeyKind::Record);
    EXPECT_EQ(key.language, "zh");
    EXPECT_EQ(key.tokenizer_id, "icu");
    EXPECT_EQ(key.offset, 12345u);

    EXPECT_THROW(decode_key("X"), StoreError);
}

TEST(StoreKeysTest, ValuesRoundTrip) {
    StoredRecord record{3, 4, RecordStatus::Scored};
    EXPECT_EQ(decode_record(encode_record(record)), record);
    EXPECT_EQ(decode_offset(encode_offset(987654321)), 987654321u);
    ShardPlan plan = plan_shards(100, 4);
    EXPECT_EQ(decode_shard_plan(encode_shard_plan(plan)), plan);
    EXPECT_THROW(decode_record("abc"), StoreError);
}

TEST(ResultStoreTest, CommitsRecordsAndCheckpointTogether) {
    TempDir dir;
    const std::string path = dir.file("store");
    {
        ResultStore store(path);
        store.put_shard_plan("ur", "rule", single_shard(10));
        store.commit_shard_batch(make_commit("rule", {0, 10}, 0, 4, 3, 4));

        EXPECT_EQ(store.get_checkpoint("ur", "rule", 0), std::optional<uint64_t>(3));
        ASSERT_TRUE(store.get_record("ur", "rule", 2).has_value());
        EXPECT_EQ(*store.get_record("ur", "rule", 2), (StoredRecord{3, 4, RecordStatus::Scored}));
        EXPECT_FALSE(store.get_record("ur", "rule", 4).has_value());
    }

    ResultStore reopened(path);
    EXPECT_EQ(reopened.get_checkpoint("ur", "rule", 0), std::optional<uint64_t>(3));
    EXPECT_EQ(count_records(reopened, "rule", 9), 4u);
    EXPECT_TRUE(std::filesystem::exists(dir.file("store/CURRENT")));
}

TEST(ResultStoreTest, SecondInstanceOnSameDirectoryIsRejected) {
    TempDir dir;
    ResultStore store(dir.file("store"));
    EXPECT_THROW(ResultStore second(dir.file("store")), StoreError);
}

TEST(ResultStoreTest, MissingStoreWithoutCreateThrows) {
    TempDir dir;
    ResultStore::Options options;
    options.create_if_missing = false;
    EXPECT_THROW(ResultStore store(dir.file("absent"), options), StoreError);
    EXPECT_FALSE(std::filesystem::exists(dir.file("absent")));
}

TEST(ResultStoreTest, RejectsInvalidShardCommits) {
    TempDir dir;
    ResultStore store(dir.file("store"));

    // No plan yet
    EXPECT_THROW(store.commit_shard_batch(make_commit("rule", {0, 10}, 0, 2)), StoreError);

    store.put_shard_plan("ur", "rule", plan_shards(10, 2));
    store.commit_shard_batch(make_commit("rule", {0, 5}, 0, 2));

    // Gap, regression and a shard that is not in the plan
    EXPECT_THROW(store.commit_shard_batch(make_commit("rule", {0, 5}, 3, 1)), StoreError);
    EXPECT_THROW(store.commit_shard_batch(make_commit("rule", {0, 5}, 1, 1)), StoreError);
    EXPECT_THROW(store.commit_shard_batch(make_commit("rule", {0, 10}, 2, 1)), StoreError);
    // Runs past the shard end
    EXPECT_THROW(store.commit_shard_batch(make_commit("rule", {0, 5}, 2, 4)), StoreError);
    // More hits than tokens
    EXPECT_THROW(store.commit_shard_batch(make_commit("rule", {0, 5}, 2, 1, 5, 4)), StoreError);

    ResultStore::ShardCommit degenerate = make_commit("rule", {0, 5}, 2, 1);
    degenerate.records[0].second.status = RecordStatus::Degenerate;
    EXPECT_THROW(store.commit_shard_batch(degenerate), StoreError);

    // Nothing from the rejected commits is visible
    EXPECT_EQ(store.get_checkpoint("ur", "rule", 0), std::optional<uint64_t>(1));
    EXPECT_EQ(count_records(store, "rule", 9), 2u);

    // The second shard has its own checkpoint
    store.commit_shard_batch(make_commit("rule", {5, 10}, 5, 3));
    EXPECT_EQ(store.get_checkpoint("ur", "rule", 5), std::optional<uint64_t>(7));
    EXPECT_EQ(store.get_checkpoint("ur", "rule", 0), std::optional<uint64_t>(1));
}

TEST(ResultStoreTest, SnapshotDoesNotSeeLaterCommits) {
    TempDir dir;
    ResultStore store(dir.file("store"));
    store.put_shard_plan("ur", "icu", single_shard(8));
    store.commit_shard_batch(make_commit("icu", {0, 8}, 0, 2));

    ResultStore::Snapshot view = store.snapshot();
    store.commit_shard_batch(make_commit("icu", {0, 8}, 2, 2));
    store.reset_namespace("ur", "other");

    EXPECT_EQ(view.get_checkpoint("ur", "icu", 0), std::optional<uint64_t>(1));
    EXPECT_FALSE(view.get_record("ur", "icu", 2).has_value());
    uint64_t seen = 0;
    view.for_each_record("ur", "icu", 0, 7, [&seen](uint64_t, const StoredRecord&) { ++seen; });
    EXPECT_EQ(seen, 2u);

    EXPECT_EQ(store.get_checkpoint("ur", "icu", 0), std::optional<uint64_t>(3));
    EXPECT_EQ(count_records(store, "icu", 7), 4u);
}

TEST(ResultStoreTest, CreatesMissingParentDirectories) {
    TempDir dir;
    const std::string path = dir.file("nested/results/store");
    {
        ResultStore store(path);
        store.put_shard_plan("hi", "rule", single_shard(3));
    }
    ResultStore::Options options;
    options.create_if_missing = false;
    ResultStore reopened(path, options);
    EXPECT_TRUE(reopened.get_shard_plan("hi", "rule").has_value());
}

TEST(ResultStoreTest, ResetNamespaceOnlyTouchesOnePair) {
    TempDir dir;
    ResultStore store(dir.file("store"));
    for (const std::string tokenizer : {"a", "ab", "rule"}) {
        store.put_shard_plan("ur", tokenizer, single_shard(5));
        store.commit_shard_batch(make_commit(tokenizer, {0, 5}, 0, 5));
    }

    store.reset_namespace("ur", "a");

    EXPECT_FALSE(store.get_shard_plan("ur", "a").has_value());
    EXPECT_FALSE(store.get_checkpoint("ur", "a", 0).has_value());
    EXPECT_EQ(count_records(store, "a", 4), 0u);
    EXPECT_EQ(count_records(store, "ab", 4), 5u);
    EXPECT_EQ(count_records(store, "rule", 4), 5u);
    EXPECT_EQ(store.get_checkpoint("ur", "ab", 0), std::optional<uint64_t>(4));

    auto namespaces = store.snapshot().list_namespaces();
    ASSERT_EQ(namespaces.size(), 2u);
}

TEST(ResultStoreTest, ForEachRecordVisitsClosedRangeInOrder) {
    TempDir dir;
    ResultStore store(dir.file("store"));
    store.put_shard_plan("ur", "rule", single_shard(300));
    store.commit_shard_batch(make_commit("rule", {0, 300}, 0, 300));

    std::vector<uint64_t> offsets;
    store.snapshot().for_each_record("ur", "rule", 250, 260,
                                     [&offsets](uint64_t offset, const StoredRecord&) { offsets.push_back(offset); });
    ASSERT_EQ(offsets.size(), 11u);
    EXPECT_EQ(offsets.front(), 250u);
    EXPECT_EQ(offsets.back(), 260u);
    EXPECT_TRUE(std::is_sorted(offsets.begin(), offsets.end()));
}

TEST(ResultStoreTest, CompactKeepsLiveEntriesOnly) {
    TempDir dir;
    const std::string path = dir.file("store");
    {
        ResultStore store(path);
        store.put_shard_plan("ur", "old", single_shard(50));
        store.commit_shard_batch(make_commit("old", {0, 50}, 0, 50));
        store.reset_namespace("ur", "old");
        store.put_shard_plan("ur", "rule", single_shard(20));
        for (uint64_t first = 0; first < 20; first += 2) {
            store.commit_shard_batch(make_commit("rule", {0, 20}, first, 2));
        }
        store.compact();

        StoreStats stats = store.stats();
        EXPECT_GT(stats.disk_bytes, 0u);
        EXPECT_EQ(stats.record_entries, 20u);
        // 20 records, one checkpoint, one plan
        EXPECT_EQ(stats.entries, 22u);

        // Still writable after compaction
        store.put_shard_plan("zh", "icu", single_shard(1));
    }

    ResultStore store(path);
    EXPECT_EQ(store.get_checkpoint("ur", "rule", 0), std::optional<uint64_t>(19));
    EXPECT_EQ(count_records(store, "rule", 19), 20u);
    EXPECT_FALSE(store.get_shard_plan("ur", "old").has_value());
    EXPECT_TRUE(store.get_shard_plan("zh", "icu").has_value());
}

TEST(ResultStoreTest, BackupOpensAsIndependentStore) {
    TempDir dir;
    ResultStore store(dir.file("store"));
    store.put_shard_plan("ur", "rule", single_shard(6));
    store.commit_shard_batch(make_commit("rule", {0, 6}, 0, 6, 2, 3));

    store.backup_to(dir.file("backup"));
    EXPECT_THROW(store.backup_to(dir.file("store")), StoreError);
    // A backup never merges into an existing store
    EXPECT_THROW(store.backup_to(dir.file("backup")), StoreError);

    // Later commits do not reach the backup
    store.reset_namespace("ur", "rule");

    ResultStore backup(dir.file("backup"));
    EXPECT_EQ(backup.get_checkpoint("ur", "rule", 0), std::optional<uint64_t>(5));
    EXPECT_EQ(*backup.get_record("ur", "rule", 5), (StoredRecord{2, 3, RecordStatus::Scored}));
}

TEST(ResultStoreTest, ExportsRecordsAsCsv) {
    TempDir dir;
    ResultStore store(dir.file("store"));
    store.put_shard_plan("ur", "rule", single_shard(3));
    ResultStore::ShardCommit commit = make_commit("rule", {0, 3}, 0, 3, 3, 4);
    commit.records[1].second = StoredRecord{0, 0, RecordStatus::Degenerate};
    commit.records[2].second = StoredRecord{0, 0, RecordStatus::Skipped};
    store.commit_shard_batch(commit);

    const std::string csv = dir.file("records.csv");
    EXPECT_EQ(store.export_csv(csv), 3u);
    auto lines = tokbench::testing::read_lines(csv);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "language,tokenizer,offset,status,hits,tokens");
    EXPECT_EQ(lines[1], "ur,rule,0,scored,3,4");
    EXPECT_EQ(lines[2], "ur,rule,1,degenerate,0,0");
    EXPECT_EQ(lines[3], "ur,rule,2,skipped,0,0");
}

TEST(ResultStoreTest, DestroyRemovesDirectory) {
    TempDir dir;
    const std::string path = dir.file("store");
    {
        ResultStore store(path);
        store.put_shard_plan("ur", "rule", single_shard(1));
    }
    ResultStore::destroy(path);
    EXPECT_FALSE(std::filesystem::exists(path));
}
