#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace tokbench {
namespace store {

// Why a committed offset has the counts it has.
enum class RecordStatus : uint8_t {
    Scored = 0,
    Degenerate = 1,  // empty after cleaning or no tokens left
    Skipped = 2      // load, cleaning or tokenizer failure
};

const char* record_status_name(RecordStatus status);

struct StoredRecord {
    uint64_t hits = 0;
    uint64_t tokens = 0;
    RecordStatus status = RecordStatus::Scored;

    bool operator==(const StoredRecord& other) const {
        return hits == other.hits && tokens == other.tokens && status == other.status;
    }
};

// Half-open offset range [begin, end) owned by one shard worker.
struct ShardRange {
    uint64_t begin = 0;
    uint64_t end = 0;

    uint64_t size() const { return end > begin ? end - begin : 0; }
    bool contains(uint64_t offset) const { return offset >= begin && offset < end; }
    bool operator==(const ShardRange& other) const { return begin == other.begin && end == other.end; }
};

struct ShardPlan {
    std::vector<ShardRange> shards;

    uint64_t total_sentences() const { return shards.empty() ? 0 : shards.back().end; }
    bool contains(const ShardRange& range) const;
    bool operator==(const ShardPlan& other) const { return shards == other.shards; }
};

// Splits [0, total) into at most `workers` contiguous, non-empty shards.
ShardPlan plan_shards(uint64_t total_sentences, size_t workers);

struct StoreStats {
    uint64_t entries = 0;
    uint64_t record_entries = 0;
    uint64_t data_bytes = 0;   // sum of key and value sizes
    uint64_t disk_bytes = 0;   // files in the store directory
};

} // namespace store
} // namespace tokbench
