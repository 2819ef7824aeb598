#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include "store_types.hpp"

namespace tokbench {
namespace store {

/**
 * @brief Durable ordered key-value store holding per-sentence records,
 * per-shard checkpoints and shard plans, backed by LevelDB.
 *
 * Every commit is one synced LevelDB write batch, so a record batch and the
 * checkpoint advance that covers it become visible together or not at all.
 * Records stay on disk; memory use is bounded by LevelDB's write buffer and
 * block cache. LevelDB's own LOCK file keeps a second process (or a second
 * instance in this process) off the directory.
 * Thread-safe: commits are serialized, reads go straight to LevelDB.
 */
class ResultStore {
public:
    using RecordVisitor = std::function<void(uint64_t offset, const StoredRecord& record)>;

    struct Options {
        bool create_if_missing = true;
        bool sync_writes = true;
        size_t block_cache_bytes = 8 << 20;
    };

    // Records for one shard, in offset order, plus the checkpoint they imply.
    struct ShardCommit {
        std::string language;
        std::string tokenizer_id;
        ShardRange shard;
        std::vector<std::pair<uint64_t, StoredRecord>> records;
    };

    /**
     * @brief Consistent read view pinned to a LevelDB snapshot. Commits made
     * after it was taken are invisible to it. Must not outlive the store.
     */
    class Snapshot {
    public:
        Snapshot(Snapshot&& other) noexcept;
        Snapshot& operator=(Snapshot&&) = delete;
        Snapshot(const Snapshot&) = delete;
        Snapshot& operator=(const Snapshot&) = delete;
        ~Snapshot();

        std::optional<uint64_t> get_checkpoint(const std::string& language, const std::string& tokenizer_id,
                                               uint64_t shard_begin) const;
        std::optional<StoredRecord> get_record(const std::string& language, const std::string& tokenizer_id,
                                               uint64_t offset) const;
        std::optional<ShardPlan> get_shard_plan(const std::string& language,
                                                const std::string& tokenizer_id) const;

        // Visits records with first <= offset <= last in offset order.
        void for_each_record(const std::string& language, const std::string& tokenizer_id,
                             uint64_t first, uint64_t last, const RecordVisitor& visitor) const;

        // (language, tokenizer) pairs that have a shard plan.
        std::vector<std::pair<std::string, std::string>> list_namespaces() const;

        // Visits every key and value in key order.
        void for_each_entry(const std::function<void(const leveldb::Slice& key,
                                                     const leveldb::Slice& value)>& visitor) const;

    private:
        friend class ResultStore;
        explicit Snapshot(leveldb::DB* db);

        leveldb::ReadOptions read_options(bool scan) const;
        std::optional<std::string> get(const std::string& key) const;

        leveldb::DB* db_;
        const leveldb::Snapshot* snapshot_;
    };

    // Opens (and recovers) the store in directory path. Throws StoreError.
    explicit ResultStore(std::string path, Options options = Options());
    ~ResultStore();

    ResultStore(const ResultStore&) = delete;
    ResultStore& operator=(const ResultStore&) = delete;

    Snapshot snapshot() const;

    void commit(leveldb::WriteBatch& batch);

    /**
     * @brief Atomically stores shard records and advances the shard checkpoint
     * to the last offset.
     *
     * The shard must be part of the namespace's persisted plan, offsets must
     * continue exactly from the current checkpoint and stay inside the shard,
     * hits may not exceed tokens and degenerate or skipped records must be
     * zero. Violations throw StoreError and leave the store unchanged.
     */
    void commit_shard_batch(const ShardCommit& commit);

    void put_shard_plan(const std::string& language, const std::string& tokenizer_id, const ShardPlan& plan);

    // Deletes every record, checkpoint and the plan of one namespace in one commit.
    void reset_namespace(const std::string& language, const std::string& tokenizer_id);

    std::optional<uint64_t> get_checkpoint(const std::string& language, const std::string& tokenizer_id,
                                           uint64_t shard_begin) const;
    std::optional<StoredRecord> get_record(const std::string& language, const std::string& tokenizer_id,
                                           uint64_t offset) const;
    std::optional<ShardPlan> get_shard_plan(const std::string& language, const std::string& tokenizer_id) const;

    StoreStats stats() const;

    // Writes every record as CSV; returns the number of rows written.
    uint64_t export_csv(const std::string& output_path) const;

    // Copies the current state into a new store in directory destination.
    void backup_to(const std::string& destination) const;

    // Compacts the whole key range, dropping deleted and overwritten entries.
    void compact();

    const std::string& path() const { return path_; }

    // Removes a closed store directory.
    static void destroy(const std::string& path);

private:
    std::string path_;
    Options options_;
    std::unique_ptr<leveldb::Cache> block_cache_;
    std::unique_ptr<leveldb::DB> db_;
    std::mutex write_mutex_;

    void write_locked(leveldb::WriteBatch& batch);
    std::optional<std::string> get_locked(const std::string& key) const;
    void delete_prefix(leveldb::WriteBatch& batch, const std::string& prefix) const;
    uint64_t disk_bytes() const;
};

} // namespace store
} // namespace tokbench
