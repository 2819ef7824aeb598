#include "../include/pipeline.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include "../include/tokenizer_factory.hpp"
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace tokbench {

namespace {

std::string shard_label(const std::string& language, const std::string& tokenizer_id,
                        uint64_t begin, uint64_t end) {
    return language + "/" + tokenizer_id + " [" + std::to_string(begin) + ", " + std::to_string(end) + ")";
}

} // namespace

ShardOutcome& ShardOutcome::operator+=(const ShardOutcome& other) {
    processed += other.processed;
    scored += other.scored;
    degenerate += other.degenerate;
    skipped += other.skipped;
    batches_committed += other.batches_committed;
    cancelled = cancelled || other.cancelled;
    return *this;
}

ShardWorker::ShardWorker(PipelineContext context,
                         const TextCleaner& cleaner,
                         WordTokenizer& tokenizer,
                         const GroundTruthVocabulary& vocabulary,
                         store::ResultStore& store,
                         CorpusReader& reader,
                         const std::atomic<bool>& stop)
    : context_(std::move(context)),
      language_code_(language_code(context_.language)),
      cleaner_(cleaner),
      tokenizer_(tokenizer),
      scorer_(vocabulary),
      store_(store),
      reader_(reader),
      stop_(stop) {}

store::StoredRecord ShardWorker::process(uint64_t offset) {
    store::StoredRecord record;
    try {
        Sentence sentence = reader_.read(offset, context_.language);
        CleanedSentence cleaned = cleaner_.clean(sentence);
        if (cleaned.degenerate) {
            record.status = store::RecordStatus::Degenerate;
            return record;
        }
        HitRecord hits = scorer_.score(tokenizer_.tokenize_sentence(cleaned));
        if (hits.tokens == 0) {
            // Every token was punctuation or filtered as foreign
            record.status = store::RecordStatus::Degenerate;
            return record;
        }
        record.hits = hits.hits;
        record.tokens = hits.tokens;
        record.status = store::RecordStatus::Scored;
    } catch (const LoadError& e) {
        log_warning("Skipping " + language_code_ + " sentence " + std::to_string(offset) + ": " + e.what());
        record = store::StoredRecord{0, 0, store::RecordStatus::Skipped};
    } catch (const CleaningError& e) {
        log_warning("Skipping " + language_code_ + " sentence " + std::to_string(offset) + ": " + e.what());
        record = store::StoredRecord{0, 0, store::RecordStatus::Skipped};
    } catch (const TokenizerRuntimeError& e) {
        log_warning("Skipping " + language_code_ + " sentence " + std::to_string(offset) +
                    " for " + context_.tokenizer_id + ": " + e.what());
        record = store::StoredRecord{0, 0, store::RecordStatus::Skipped};
    }
    return record;
}

void ShardWorker::flush(store::ResultStore::ShardCommit& pending, ShardOutcome& outcome) {
    if (pending.records.empty()) {
        return;
    }
    store_.commit_shard_batch(pending);
    ++outcome.batches_committed;
    for (const auto& entry : pending.records) {
        switch (entry.second.status) {
            case store::RecordStatus::Scored:     ++outcome.scored; break;
            case store::RecordStatus::Degenerate: ++outcome.degenerate; break;
            case store::RecordStatus::Skipped:    ++outcome.skipped; break;
        }
    }
    outcome.processed += pending.records.size();
    pending.records.clear();
}

ShardOutcome ShardWorker::run() {
    const std::string label = shard_label(language_code_, context_.tokenizer_id, context_.begin, context_.end);
    ShardOutcome outcome;

    tokenizer_.initialize();

    std::optional<uint64_t> checkpoint = store_.get_checkpoint(language_code_, context_.tokenizer_id, context_.begin);
    uint64_t next = checkpoint ? *checkpoint + 1 : context_.begin;
    if (next >= context_.end) {
        log_debug("Shard " + label + " already complete");
        return outcome;
    }
    if (checkpoint) {
        log_info("Resuming shard " + label + " at offset " + std::to_string(next));
    }

    store::ResultStore::ShardCommit pending;
    pending.language = language_code_;
    pending.tokenizer_id = context_.tokenizer_id;
    pending.shard = store::ShardRange{context_.begin, context_.end};
    pending.records.reserve(context_.batch_size);

    uint64_t since_progress = 0;
    for (uint64_t offset = next; offset < context_.end; ++offset) {
        if (stop_.load()) {
            outcome.cancelled = true;
            log_info("Stopping shard " + label + " before offset " + std::to_string(offset) + ", dropping " +
                     std::to_string(pending.records.size()) + " uncommitted sentences");
            return outcome;
        }

        pending.records.emplace_back(offset, process(offset));
        if (pending.records.size() >= context_.batch_size) {
            flush(pending, outcome);
        }

        if (++since_progress >= context_.progress_interval) {
            since_progress = 0;
            log_info("Shard " + label + ": " + std::to_string(offset + 1 - context_.begin) + "/" +
                     std::to_string(context_.end - context_.begin) + " sentences");
        }
    }
    flush(pending, outcome);

    log_info("Finished shard " + label + ": " + std::to_string(outcome.scored) + " scored, " +
             std::to_string(outcome.degenerate) + " degenerate, " + std::to_string(outcome.skipped) + " skipped");
    return outcome;
}

BenchmarkRunner::BenchmarkRunner(const BenchmarkConfig& config,
                                 store::ResultStore& store,
                                 const GroundTruthVocabulary& vocabulary,
                                 std::atomic<bool>& stop,
                                 TokenizerFactory factory)
    : config_(config),
      store_(store),
      vocabulary_(vocabulary),
      stop_(stop),
      factory_(std::move(factory)),
      cleaner_(config.language, config.cleaning_table()) {
    if (!factory_) {
        factory_ = [](const std::string& id, Language language, const TokenizerOptions& options, bool filter) {
            return make_tokenizer(id, language, options, filter);
        };
    }
}

std::unique_ptr<WordTokenizer> BenchmarkRunner::create_tokenizer(const std::string& tokenizer_id) const {
    return factory_(tokenizer_id, config_.language, config_.options_for(tokenizer_id), config_.filter_foreign_tokens);
}

store::ShardPlan BenchmarkRunner::prepare_plan(const std::string& tokenizer_id, uint64_t total_sentences) {
    const std::string language = language_code(config_.language);

    if (!config_.resume) {
        store_.reset_namespace(language, tokenizer_id);
    } else if (std::optional<store::ShardPlan> existing = store_.get_shard_plan(language, tokenizer_id)) {
        if (existing->total_sentences() != total_sentences) {
            throw ConfigError("Corpus " + config_.input_path + " has " + std::to_string(total_sentences) +
                              " sentences but the stored results for " + language + "/" + tokenizer_id +
                              " cover " + std::to_string(existing->total_sentences()) +
                              "; run with \"resume\": false to start over");
        }
        if (existing->shards.size() != config_.num_workers) {
            log_info("Resuming " + language + "/" + tokenizer_id + " with its stored plan of " +
                     std::to_string(existing->shards.size()) + " shards");
        }
        return *existing;
    }

    store::ShardPlan plan = store::plan_shards(total_sentences, config_.num_workers);
    store_.put_shard_plan(language, tokenizer_id, plan);
    return plan;
}

TokenizerRunSummary BenchmarkRunner::run_tokenizer(const std::string& tokenizer_id, const CorpusIndex& index) {
    const std::string language = language_code(config_.language);
    TokenizerRunSummary summary;
    summary.tokenizer_id = tokenizer_id;
    summary.totals.language = language;
    summary.totals.tokenizer_id = tokenizer_id;

    // Initialize once before touching the store so a broken tokenizer keeps its old results
    std::unique_ptr<WordTokenizer> first_instance = create_tokenizer(tokenizer_id);
    try {
        first_instance->initialize();
    } catch (const TokenizerInitError& e) {
        log_error("Dropping tokenizer " + tokenizer_id + " for " + language + ": " + e.what());
        summary.init_failed = true;
        summary.error = e.what();
        return summary;
    }

    store::ShardPlan plan = prepare_plan(tokenizer_id, index.size());
    log_info("Running " + tokenizer_id + " on " + std::to_string(index.size()) + " " + language +
             " sentences in " + std::to_string(plan.shards.size()) + " shards");

    const size_t shard_count = plan.shards.size();
    std::vector<std::unique_ptr<WordTokenizer>> tokenizers;
    std::vector<std::unique_ptr<CorpusReader>> readers;
    for (size_t i = 0; i < shard_count; ++i) {
        tokenizers.push_back(i == 0 ? std::move(first_instance) : create_tokenizer(tokenizer_id));
        readers.push_back(std::make_unique<CorpusReader>(index, config_.max_line_bytes));
    }

    std::vector<ShardOutcome> outcomes(shard_count);
    std::mutex error_mutex;
    std::exception_ptr fatal_error;
    std::string init_error;

    std::vector<std::thread> threads;
    threads.reserve(shard_count);
    for (size_t i = 0; i < shard_count; ++i) {
        threads.emplace_back([&, i]() {
            PipelineContext context;
            context.language = config_.language;
            context.tokenizer_id = tokenizer_id;
            context.begin = plan.shards[i].begin;
            context.end = plan.shards[i].end;
            context.batch_size = config_.batch_size;
            context.progress_interval = config_.progress_interval;

            ShardWorker worker(context, cleaner_, *tokenizers[i], vocabulary_, store_, *readers[i], stop_);
            try {
                outcomes[i] = worker.run();
            } catch (const TokenizerInitError& e) {
                std::lock_guard<std::mutex> lock(error_mutex);
                log_error("Tokenizer " + tokenizer_id + " failed to initialize in shard " + std::to_string(i) +
                          ": " + e.what());
                if (init_error.empty()) {
                    init_error = e.what();
                }
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!fatal_error) {
                    fatal_error = std::current_exception();
                }
                stop_.store(true);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    if (fatal_error) {
        std::rethrow_exception(fatal_error);
    }

    for (const auto& outcome : outcomes) {
        summary.outcome += outcome;
    }
    if (!init_error.empty()) {
        summary.init_failed = true;
        summary.error = init_error;
    }
    summary.totals = Aggregator(store_).aggregate(language, tokenizer_id);

    log_info("Tokenizer " + tokenizer_id + " " + (summary.outcome.cancelled ? "interrupted" : "finished") +
             ": hit ratio " + std::to_string(summary.totals.hit_ratio()) + " over " +
             std::to_string(summary.totals.total_tokens) + " tokens");
    return summary;
}

RunReport BenchmarkRunner::run() {
    config_.require_inputs();
    CorpusIndex index = CorpusIndex::build(config_.input_path);

    RunReport report;
    for (const auto& tokenizer_id : config_.tokenizers) {
        if (stop_.load()) {
            report.cancelled = true;
            break;
        }
        TokenizerRunSummary summary = run_tokenizer(tokenizer_id, index);
        report.cancelled = report.cancelled || summary.outcome.cancelled;
        report.tokenizers.push_back(std::move(summary));
    }
    if (stop_.load()) {
        report.cancelled = true;
    }

    if (config_.compact_on_finish && !report.cancelled) {
        store_.compact();
    }
    return report;
}

void to_json(nlohmann::json& j, const RunReport& report) {
    j = nlohmann::json::object();
    j["cancelled"] = report.cancelled;
    j["results"] = nlohmann::json::array();
    for (const auto& summary : report.tokenizers) {
        nlohmann::json entry;
        if (summary.init_failed && summary.outcome.processed == 0) {
            entry["language"] = summary.totals.language;
            entry["tokenizer"] = summary.tokenizer_id;
            entry["error"] = summary.error;
        } else {
            entry = summary.totals;
            entry["processed_this_run"] = summary.outcome.processed;
            if (summary.init_failed) {
                entry["error"] = summary.error;
            }
        }
        j["results"].push_back(entry);
    }
}

} // namespace tokbench
