#include "../../include/store/result_store.hpp"
#include "../../include/store/keys.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <filesystem>
#include <fstream>
#include <leveldb/iterator.h>
#include <leveldb/options.h>

namespace tokbench {
namespace store {

namespace fs = std::filesystem;

namespace {

// Puts per write batch when copying into a backup
constexpr size_t BACKUP_BATCH_ENTRIES = 10000;

void check_status(const leveldb::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw StoreError(what + ": " + status.ToString());
    }
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

void validate_record(uint64_t offset, const StoredRecord& record) {
    if (record.hits > record.tokens) {
        throw StoreError("record " + std::to_string(offset) + " has more hits (" +
                         std::to_string(record.hits) + ") than tokens (" + std::to_string(record.tokens) + ")");
    }
    if (record.status != RecordStatus::Scored && (record.hits != 0 || record.tokens != 0)) {
        throw StoreError("record " + std::to_string(offset) + " is " + record_status_name(record.status) +
                         " but carries non-zero counts");
    }
}

void create_parent_directories(const std::string& path) {
    const fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw StoreError("Could not create directory " + parent.string() + ": " + ec.message());
    }
}

} // namespace

// --- Snapshot ---

ResultStore::Snapshot::Snapshot(leveldb::DB* db) : db_(db), snapshot_(db->GetSnapshot()) {}

ResultStore::Snapshot::Snapshot(Snapshot&& other) noexcept : db_(other.db_), snapshot_(other.snapshot_) {
    other.snapshot_ = nullptr;
}

ResultStore::Snapshot::~Snapshot() {
    if (snapshot_) {
        db_->ReleaseSnapshot(snapshot_);
    }
}

leveldb::ReadOptions ResultStore::Snapshot::read_options(bool scan) const {
    leveldb::ReadOptions options;
    options.snapshot = snapshot_;
    options.verify_checksums = true;
    // Long scans should not evict the point lookups from the block cache
    options.fill_cache = !scan;
    return options;
}

std::optional<std::string> ResultStore::Snapshot::get(const std::string& key) const {
    std::string value;
    leveldb::Status status = db_->Get(read_options(false), key, &value);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    check_status(status, "Could not read result store");
    return value;
}

std::optional<uint64_t> ResultStore::Snapshot::get_checkpoint(const std::string& language,
                                                              const std::string& tokenizer_id,
                                                              uint64_t shard_begin) const {
    std::optional<std::string> value = get(checkpoint_key(language, tokenizer_id, shard_begin));
    if (!value) {
        return std::nullopt;
    }
    return decode_offset(*value);
}

std::optional<StoredRecord> ResultStore::Snapshot::get_record(const std::string& language,
                                                              const std::string& tokenizer_id,
                                                              uint64_t offset) const {
    std::optional<std::string> value = get(record_key(language, tokenizer_id, offset));
    if (!value) {
        return std::nullopt;
    }
    return decode_record(*value);
}

std::optional<ShardPlan> ResultStore::Snapshot::get_shard_plan(const std::string& language,
                                                               const std::string& tokenizer_id) const {
    std::optional<std::string> value = get(shard_plan_key(language, tokenizer_id));
    if (!value) {
        return std::nullopt;
    }
    return decode_shard_plan(*value);
}

void ResultStore::Snapshot::for_each_record(const std::string& language, const std::string& tokenizer_id,
                                            uint64_t first, uint64_t last,
                                            const RecordVisitor& visitor) const {
    if (first > last) {
        return;
    }
    const std::string prefix = namespace_prefix(KeyKind::Record, language, tokenizer_id);
    const std::string end_key = record_key(language, tokenizer_id, last);

    std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(read_options(true)));
    for (it->Seek(record_key(language, tokenizer_id, first)); it->Valid(); it->Next()) {
        const leveldb::Slice key = it->key();
        if (!key.starts_with(prefix) || key.compare(end_key) > 0) {
            break;
        }
        visitor(decode_key(key.ToString()).offset, decode_record(it->value().ToString()));
    }
    check_status(it->status(), "Could not scan records of " + language + "/" + tokenizer_id);
}

std::vector<std::pair<std::string, std::string>> ResultStore::Snapshot::list_namespaces() const {
    std::vector<std::pair<std::string, std::string>> namespaces;
    const std::string prefix(1, static_cast<char>(KeyKind::ShardPlan));

    std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(read_options(true)));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        DecodedKey key = decode_key(it->key().ToString());
        namespaces.emplace_back(key.language, key.tokenizer_id);
    }
    check_status(it->status(), "Could not list shard plans");
    return namespaces;
}

void ResultStore::Snapshot::for_each_entry(
    const std::function<void(const leveldb::Slice& key, const leveldb::Slice& value)>& visitor) const {
    std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(read_options(true)));
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        visitor(it->key(), it->value());
    }
    check_status(it->status(), "Could not scan result store");
}

// --- ResultStore ---

ResultStore::ResultStore(std::string path, Options options)
    : path_(std::move(path)), options_(options) {
    std::error_code ec;
    if (fs::exists(path_, ec) && !fs::is_directory(path_, ec)) {
        throw StoreError("Store path is not a directory: " + path_);
    }
    if (options_.create_if_missing) {
        create_parent_directories(path_);
    } else if (!fs::exists(path_, ec)) {
        // LevelDB would leave an empty directory behind before failing
        throw StoreError("Store does not exist: " + path_);
    }

    leveldb::Options db_options;
    db_options.create_if_missing = options_.create_if_missing;
    if (options_.block_cache_bytes > 0) {
        block_cache_.reset(leveldb::NewLRUCache(options_.block_cache_bytes));
        db_options.block_cache = block_cache_.get();
    }

    leveldb::DB* db = nullptr;
    check_status(leveldb::DB::Open(db_options, path_, &db), "Could not open result store " + path_);
    db_.reset(db);

    log_info("Opened result store " + path_);
}

ResultStore::~ResultStore() {
    // The database has to close before its block cache goes away
    db_.reset();
    block_cache_.reset();
}

ResultStore::Snapshot ResultStore::snapshot() const {
    return Snapshot(db_.get());
}

void ResultStore::write_locked(leveldb::WriteBatch& batch) {
    leveldb::WriteOptions write_options;
    write_options.sync = options_.sync_writes;
    check_status(db_->Write(write_options, &batch), "Could not commit to result store " + path_);
}

std::optional<std::string> ResultStore::get_locked(const std::string& key) const {
    std::string value;
    leveldb::Status status = db_->Get(leveldb::ReadOptions(), key, &value);
    if (status.IsNotFound()) {
        return std::nullopt;
    }
    check_status(status, "Could not read result store " + path_);
    return value;
}

void ResultStore::delete_prefix(leveldb::WriteBatch& batch, const std::string& prefix) const {
    leveldb::ReadOptions read_options;
    read_options.fill_cache = false;
    std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(read_options));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        batch.Delete(it->key());
    }
    check_status(it->status(), "Could not scan result store " + path_);
}

void ResultStore::commit(leveldb::WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    write_locked(batch);
}

void ResultStore::commit_shard_batch(const ShardCommit& commit) {
    if (commit.records.empty()) {
        return;
    }

    // Held across the checks so the checkpoint cannot move underneath them
    std::lock_guard<std::mutex> lock(write_mutex_);

    std::optional<std::string> plan = get_locked(shard_plan_key(commit.language, commit.tokenizer_id));
    if (!plan) {
        throw StoreError("No shard plan for " + commit.language + "/" + commit.tokenizer_id);
    }
    if (!decode_shard_plan(*plan).contains(commit.shard)) {
        throw StoreError("Shard [" + std::to_string(commit.shard.begin) + ", " + std::to_string(commit.shard.end) +
                         ") is not part of the plan for " + commit.language + "/" + commit.tokenizer_id);
    }

    const std::string cp_key = checkpoint_key(commit.language, commit.tokenizer_id, commit.shard.begin);
    uint64_t expected = commit.shard.begin;
    if (std::optional<std::string> checkpoint = get_locked(cp_key)) {
        expected = decode_offset(*checkpoint) + 1;
    }

    leveldb::WriteBatch batch;
    for (const auto& entry : commit.records) {
        const uint64_t offset = entry.first;
        if (offset != expected) {
            throw StoreError("Non-contiguous commit for " + commit.language + "/" + commit.tokenizer_id +
                             ": expected offset " + std::to_string(expected) + ", got " + std::to_string(offset));
        }
        if (!commit.shard.contains(offset)) {
            throw StoreError("Offset " + std::to_string(offset) + " lies outside shard [" +
                             std::to_string(commit.shard.begin) + ", " + std::to_string(commit.shard.end) + ")");
        }
        validate_record(offset, entry.second);
        batch.Put(record_key(commit.language, commit.tokenizer_id, offset), encode_record(entry.second));
        ++expected;
    }
    batch.Put(cp_key, encode_offset(commit.records.back().first));

    write_locked(batch);
}

void ResultStore::put_shard_plan(const std::string& language, const std::string& tokenizer_id,
                                 const ShardPlan& plan) {
    leveldb::WriteBatch batch;
    batch.Put(shard_plan_key(language, tokenizer_id), encode_shard_plan(plan));
    commit(batch);
}

void ResultStore::reset_namespace(const std::string& language, const std::string& tokenizer_id) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    leveldb::WriteBatch batch;
    delete_prefix(batch, namespace_prefix(KeyKind::Record, language, tokenizer_id));
    delete_prefix(batch, namespace_prefix(KeyKind::Checkpoint, language, tokenizer_id));
    batch.Delete(shard_plan_key(language, tokenizer_id));
    write_locked(batch);
    log_info("Reset stored results for " + language + "/" + tokenizer_id);
}

std::optional<uint64_t> ResultStore::get_checkpoint(const std::string& language, const std::string& tokenizer_id,
                                                    uint64_t shard_begin) const {
    return snapshot().get_checkpoint(language, tokenizer_id, shard_begin);
}

std::optional<StoredRecord> ResultStore::get_record(const std::string& language, const std::string& tokenizer_id,
                                                    uint64_t offset) const {
    return snapshot().get_record(language, tokenizer_id, offset);
}

std::optional<ShardPlan> ResultStore::get_shard_plan(const std::string& language,
                                                     const std::string& tokenizer_id) const {
    return snapshot().get_shard_plan(language, tokenizer_id);
}

uint64_t ResultStore::disk_bytes() const {
    uint64_t total = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(path_, ec)) {
        std::error_code size_ec;
        if (entry.is_regular_file(size_ec)) {
            uint64_t size = entry.file_size(size_ec);
            if (!size_ec) {
                total += size;
            }
        }
    }
    if (ec) {
        throw StoreError("Could not list store directory " + path_ + ": " + ec.message());
    }
    return total;
}

StoreStats ResultStore::stats() const {
    StoreStats stats;
    snapshot().for_each_entry([&stats](const leveldb::Slice& key, const leveldb::Slice& value) {
        ++stats.entries;
        if (!key.empty() && key[0] == static_cast<char>(KeyKind::Record)) {
            ++stats.record_entries;
        }
        stats.data_bytes += key.size() + value.size();
    });
    stats.disk_bytes = disk_bytes();
    return stats;
}

uint64_t ResultStore::export_csv(const std::string& output_path) const {
    std::ofstream out(output_path, std::ios::trunc);
    if (!out.is_open()) {
        throw StoreError("Could not open export file: " + output_path);
    }

    Snapshot view = snapshot();
    out << "language,tokenizer,offset,status,hits,tokens\n";
    uint64_t rows = 0;
    const std::string prefix(1, static_cast<char>(KeyKind::Record));
    std::unique_ptr<leveldb::Iterator> it(db_->NewIterator(view.read_options(true)));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        DecodedKey key = decode_key(it->key().ToString());
        StoredRecord record = decode_record(it->value().ToString());
        out << csv_field(key.language) << ',' << csv_field(key.tokenizer_id) << ',' << key.offset << ','
            << record_status_name(record.status) << ',' << record.hits << ',' << record.tokens << '\n';
        ++rows;
    }
    check_status(it->status(), "Could not scan records for export");
    out.flush();
    if (!out) {
        throw StoreError("Failed writing export file: " + output_path);
    }
    log_info("Exported " + std::to_string(rows) + " records to " + output_path);
    return rows;
}

void ResultStore::backup_to(const std::string& destination) const {
    std::error_code ec;
    if (fs::equivalent(destination, path_, ec)) {
        throw StoreError("Backup destination is the store itself: " + destination);
    }
    create_parent_directories(destination);

    leveldb::Options backup_options;
    backup_options.create_if_missing = true;
    backup_options.error_if_exists = true;
    leveldb::DB* raw = nullptr;
    check_status(leveldb::DB::Open(backup_options, destination, &raw), "Could not create backup " + destination);
    std::unique_ptr<leveldb::DB> backup(raw);

    leveldb::WriteOptions chunk_options;
    leveldb::WriteBatch batch;
    size_t pending = 0;
    uint64_t copied = 0;
    snapshot().for_each_entry([&](const leveldb::Slice& key, const leveldb::Slice& value) {
        batch.Put(key, value);
        ++copied;
        if (++pending >= BACKUP_BATCH_ENTRIES) {
            check_status(backup->Write(chunk_options, &batch), "Could not write backup " + destination);
            batch.Clear();
            pending = 0;
        }
    });
    leveldb::WriteOptions final_options;
    final_options.sync = true;
    check_status(backup->Write(final_options, &batch), "Could not write backup " + destination);

    log_info("Backed up " + std::to_string(copied) + " entries to " + destination);
}

void ResultStore::compact() {
    const uint64_t before = disk_bytes();
    db_->CompactRange(nullptr, nullptr);
    log_info("Compacted store " + path_ + " from " + std::to_string(before) + " to " +
             std::to_string(disk_bytes()) + " bytes");
}

void ResultStore::destroy(const std::string& path) {
    check_status(leveldb::DestroyDB(path, leveldb::Options()), "Could not destroy store " + path);
    // DestroyDB leaves the directory behind if anything else was in it
    std::error_code ec;
    if (fs::exists(path, ec) && fs::is_empty(path, ec)) {
        fs::remove(path, ec);
    }
    if (ec) {
        throw StoreError("Could not destroy store " + path + ": " + ec.message());
    }
    log_warning("Destroyed result store " + path);
}

} // namespace store
} // namespace tokbench
