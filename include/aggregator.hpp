#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "language.hpp"
#include "store/result_store.hpp"

namespace tokbench {

/**
 * @brief Totals for one (language, tokenizer) pair over its committed offsets.
 *
 * sentence_count counts scored sentences only; degenerate and skipped
 * sentences are reported separately and contribute nothing to the sums.
 */
struct AggregateResult {
    std::string language;
    std::string tokenizer_id;
    uint64_t total_hits = 0;
    uint64_t total_tokens = 0;
    uint64_t sentence_count = 0;
    uint64_t degenerate = 0;
    uint64_t skipped = 0;

    // total_hits / total_tokens, 0 when no tokens were produced.
    double hit_ratio() const;
    uint64_t committed() const { return sentence_count + degenerate + skipped; }
};

/**
 * @brief Read-only fold over the store.
 *
 * Each call reads from a single snapshot and only visits offsets at or below
 * the checkpoint of their shard, so records of a batch that is still being
 * committed are never counted.
 */
class Aggregator {
public:
    explicit Aggregator(const store::ResultStore& store) : store_(store) {}

    AggregateResult aggregate(const std::string& language, const std::string& tokenizer_id) const;
    AggregateResult aggregate(Language language, const std::string& tokenizer_id) const;

    // One result per namespace that has a shard plan, in key order.
    std::vector<AggregateResult> aggregate_all() const;

private:
    const store::ResultStore& store_;

    static AggregateResult fold(const store::ResultStore::Snapshot& snapshot,
                                const std::string& language, const std::string& tokenizer_id);
};

void to_json(nlohmann::json& j, const AggregateResult& result);

} // namespace tokbench
