#include "../include/aggregator.hpp"
#include "../include/scorer.hpp"

namespace tokbench {

double AggregateResult::hit_ratio() const {
    return tokbench::hit_ratio(total_hits, total_tokens);
}

AggregateResult Aggregator::fold(const store::ResultStore::Snapshot& snapshot,
                                 const std::string& language, const std::string& tokenizer_id) {
    AggregateResult result;
    result.language = language;
    result.tokenizer_id = tokenizer_id;

    std::optional<store::ShardPlan> plan = snapshot.get_shard_plan(language, tokenizer_id);
    if (!plan) {
        return result;
    }

    for (const auto& shard : plan->shards) {
        std::optional<uint64_t> checkpoint = snapshot.get_checkpoint(language, tokenizer_id, shard.begin);
        if (!checkpoint) {
            continue;
        }
        snapshot.for_each_record(language, tokenizer_id, shard.begin, *checkpoint,
            [&result](uint64_t, const store::StoredRecord& record) {
                switch (record.status) {
                    case store::RecordStatus::Scored:
                        result.total_hits += record.hits;
                        result.total_tokens += record.tokens;
                        ++result.sentence_count;
                        break;
                    case store::RecordStatus::Degenerate:
                        ++result.degenerate;
                        break;
                    case store::RecordStatus::Skipped:
                        ++result.skipped;
                        break;
                }
            });
    }
    return result;
}

AggregateResult Aggregator::aggregate(const std::string& language, const std::string& tokenizer_id) const {
    auto snapshot = store_.snapshot();
    return fold(snapshot, language, tokenizer_id);
}

AggregateResult Aggregator::aggregate(Language language, const std::string& tokenizer_id) const {
    return aggregate(language_code(language), tokenizer_id);
}

std::vector<AggregateResult> Aggregator::aggregate_all() const {
    auto snapshot = store_.snapshot();
    std::vector<AggregateResult> results;
    for (const auto& ns : snapshot.list_namespaces()) {
        results.push_back(fold(snapshot, ns.first, ns.second));
    }
    return results;
}

void to_json(nlohmann::json& j, const AggregateResult& result) {
    j = nlohmann::json{
        {"language", result.language},
        {"tokenizer", result.tokenizer_id},
        {"hit_ratio", result.hit_ratio()},
        {"total_sentences", result.sentence_count},
        {"total_tokens", result.total_tokens},
        {"total_hits", result.total_hits},
        {"degenerate", result.degenerate},
        {"skipped", result.skipped}
    };
}

} // namespace tokbench
