#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "aggregator.hpp"
#include "config.hpp"
#include "corpus.hpp"
#include "scorer.hpp"
#include "store/result_store.hpp"
#include "text_cleaner.hpp"
#include "vocabulary.hpp"
#include "word_tokenizer.hpp"

namespace tokbench {

// What a shard worker is working on. Passed explicitly through every stage.
struct PipelineContext {
    Language language = Language::Urdu;
    std::string tokenizer_id;
    uint64_t begin = 0;  // first offset of the shard
    uint64_t end = 0;    // one past the last offset
    size_t batch_size = 1000;
    uint64_t progress_interval = 100000;
};

struct ShardOutcome {
    uint64_t processed = 0;
    uint64_t scored = 0;
    uint64_t degenerate = 0;
    uint64_t skipped = 0;
    uint64_t batches_committed = 0;
    bool cancelled = false;

    ShardOutcome& operator+=(const ShardOutcome& other);
};

/**
 * @brief Load -> clean -> tokenize -> score -> commit loop over one shard.
 *
 * Starts after the shard's checkpoint and commits every batch_size sentences
 * (and at the shard end) as one atomic store batch. Load, cleaning and
 * tokenizer runtime failures are logged and recorded as skipped. When the stop
 * flag is raised the uncommitted batch is dropped and run() returns; a later
 * resume reprocesses it.
 */
class ShardWorker {
public:
    ShardWorker(PipelineContext context,
                const TextCleaner& cleaner,
                WordTokenizer& tokenizer,
                const GroundTruthVocabulary& vocabulary,
                store::ResultStore& store,
                CorpusReader& reader,
                const std::atomic<bool>& stop);

    // Throws TokenizerInitError and StoreError.
    ShardOutcome run();

private:
    PipelineContext context_;
    std::string language_code_;
    const TextCleaner& cleaner_;
    WordTokenizer& tokenizer_;
    Scorer scorer_;
    store::ResultStore& store_;
    CorpusReader& reader_;
    const std::atomic<bool>& stop_;

    store::StoredRecord process(uint64_t offset);
    void flush(store::ResultStore::ShardCommit& pending, ShardOutcome& outcome);
};

using TokenizerFactory = std::function<std::unique_ptr<WordTokenizer>(
    const std::string& id, Language language, const TokenizerOptions& options, bool filter_foreign_tokens)>;

struct TokenizerRunSummary {
    std::string tokenizer_id;
    bool init_failed = false;
    std::string error;
    ShardOutcome outcome;    // this run only
    AggregateResult totals;  // everything committed for the pair
};

struct RunReport {
    std::vector<TokenizerRunSummary> tokenizers;
    bool cancelled = false;
};

/**
 * @brief Runs every configured tokenizer over the corpus, one after another,
 * each with num_workers shard workers.
 *
 * A tokenizer whose setup fails is reported and skipped. A StoreError (or any
 * other unexpected failure) in a worker raises the stop flag for the other
 * workers and is rethrown once they have joined.
 */
class BenchmarkRunner {
public:
    BenchmarkRunner(const BenchmarkConfig& config,
                    store::ResultStore& store,
                    const GroundTruthVocabulary& vocabulary,
                    std::atomic<bool>& stop,
                    TokenizerFactory factory = TokenizerFactory());

    RunReport run();

private:
    const BenchmarkConfig& config_;
    store::ResultStore& store_;
    const GroundTruthVocabulary& vocabulary_;
    std::atomic<bool>& stop_;
    TokenizerFactory factory_;
    TextCleaner cleaner_;

    TokenizerRunSummary run_tokenizer(const std::string& tokenizer_id, const CorpusIndex& index);
    store::ShardPlan prepare_plan(const std::string& tokenizer_id, uint64_t total_sentences);
    std::unique_ptr<WordTokenizer> create_tokenizer(const std::string& tokenizer_id) const;
};

void to_json(nlohmann::json& j, const RunReport& report);

} // namespace tokbench
