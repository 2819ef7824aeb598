#include <gtest/gtest.h>
#include <algorithm>
#include "../include/aggregator.hpp"
#include "../include/store/keys.hpp"
#include "test_helpers.hpp"

using namespace tokbench;
using namespace tokbench::store;
using tokbench::testing::TempDir;

namespace {

void commit_records(ResultStore& store, const std::string& tokenizer, ShardRange shard,
                    const std::vector<StoredRecord>& records, uint64_t first) {
    ResultStore::ShardCommit commit;
    commit.language = "ur";
    commit.tokenizer_id = tokenizer;
    commit.shard = shard;
    for (size_t i = 0; i < records.size(); ++i) {
        commit.records.emplace_back(first + i, records[i]);
    }
    store.commit_shard_batch(commit);
}

} // namespace

TEST(AggregatorTest, FoldsEveryShardUpToItsCheckpoint) {
    TempDir dir;
    ResultStore store(dir.file("store"));
    store.put_shard_plan("ur", "rule", plan_shards(5, 2));  // [0,3) [3,5)

    commit_records(store, "rule", {0, 3},
                   {{3, 4, RecordStatus::Scored}, {0, 0, RecordStatus::Degenerate}, {1, 2, RecordStatus::Scored}}, 0);
    commit_records(store, "rule", {3, 5}, {{0, 0, RecordStatus::Skipped}}, 3);

    // A record past the checkpoint of its shard is not committed state
    leveldb::WriteBatch stray;
    stray.Put(record_key("ur", "rule", 4), encode_record({5, 5, RecordStatus::Scored}));
    store.commit(stray);

    AggregateResult result = Aggregator(store).aggregate(Language::Urdu, "rule");
    EXPECT_EQ(result.language, "ur");
    EXPECT_EQ(result.tokenizer_id, "rule");
    EXPECT_EQ(result.total_hits, 4u);
    EXPECT_EQ(result.total_tokens, 6u);
    EXPECT_EQ(result.sentence_count, 2u);
    EXPECT_EQ(result.degenerate, 1u);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_EQ(result.committed(), 4u);
    EXPECT_DOUBLE_EQ(result.hit_ratio(), 4.0 / 6.0);
}

TEST(AggregatorTest, UnknownPairIsEmpty) {
    TempDir dir;
    ResultStore store(dir.file("store"));
    AggregateResult result = Aggregator(store).aggregate("hi", "icu");
    EXPECT_EQ(result.total_tokens, 0u);
    EXPECT_EQ(result.sentence_count, 0u);
    EXPECT_DOUBLE_EQ(result.hit_ratio(), 0.0);
}

TEST(AggregatorTest, RatioStaysWithinBounds) {
    TempDir dir;
    ResultStore store(dir.file("store"));
    store.put_shard_plan("ur", "all", plan_shards(2, 1));
    store.put_shard_plan("ur", "none", plan_shards(2, 1));
    store.put_shard_plan("ur", "empty", plan_shards(1, 1));
    commit_records(store, "all", {0, 2}, {{4, 4, RecordStatus::Scored}, {1, 1, RecordStatus::Scored}}, 0);
    commit_records(store, "none", {0, 2}, {{0, 4, RecordStatus::Scored}, {0, 1, RecordStatus::Scored}}, 0);
    commit_records(store, "empty", {0, 1}, {{0, 0, RecordStatus::Degenerate}}, 0);

    Aggregator aggregator(store);
    EXPECT_DOUBLE_EQ(aggregator.aggregate("ur", "all").hit_ratio(), 1.0);
    EXPECT_DOUBLE_EQ(aggregator.aggregate("ur", "none").hit_ratio(), 0.0);
    EXPECT_DOUBLE_EQ(aggregator.aggregate("ur", "empty").hit_ratio(), 0.0);

    std::vector<AggregateResult> all = aggregator.aggregate_all();
    ASSERT_EQ(all.size(), 3u);
    for (const auto& result : all) {
        EXPECT_GE(result.hit_ratio(), 0.0);
        EXPECT_LE(result.hit_ratio(), 1.0);
        EXPECT_LE(result.total_hits, result.total_tokens);
    }
    EXPECT_TRUE(std::any_of(all.begin(), all.end(),
                            [](const AggregateResult& r) { return r.tokenizer_id == "empty" && r.degenerate == 1; }));
}

TEST(AggregatorTest, SerializesSummaryFields) {
    AggregateResult result;
    result.language = "zh";
    result.tokenizer_id = "icu";
    result.total_hits = 2;
    result.total_tokens = 2;
    result.sentence_count = 1;
    result.skipped = 3;

    nlohmann::json j = result;
    EXPECT_EQ(j.at("language").get<std::string>(), "zh");
    EXPECT_EQ(j.at("tokenizer").get<std::string>(), "icu");
    EXPECT_DOUBLE_EQ(j.at("hit_ratio").get<double>(), 1.0);
    EXPECT_EQ(j.at("total_sentences").get<uint64_t>(), 1u);
    EXPECT_EQ(j.at("total_tokens").get<uint64_t>(), 2u);
    EXPECT_EQ(j.at("total_hits").get<uint64_t>(), 2u);
    EXPECT_EQ(j.at("degenerate").get<uint64_t>(), 0u);
    EXPECT_EQ(j.at("skipped").get<uint64_t>(), 3u);
}
