#include "../../include/store/store_types.hpp"
#include <algorithm>

namespace tokbench {
namespace store {

const char* record_status_name(RecordStatus status) {
    switch (status) {
        case RecordStatus::Scored:     return "scored";
        case RecordStatus::Degenerate: return "degenerate";
        case RecordStatus::Skipped:    return "skipped";
    }
    return "scored";
}

bool ShardPlan::contains(const ShardRange& range) const {
    return std::find(shards.begin(), shards.end(), range) != shards.end();
}

ShardPlan plan_shards(uint64_t total_sentences, size_t workers) {
    ShardPlan plan;
    if (total_sentences == 0) {
        return plan;
    }
    const uint64_t count = std::min<uint64_t>(std::max<size_t>(workers, 1), total_sentences);
    const uint64_t base = total_sentences / count;
    const uint64_t remainder = total_sentences % count;

    uint64_t begin = 0;
    for (uint64_t i = 0; i < count; ++i) {
        uint64_t size = base + (i < remainder ? 1 : 0);
        plan.shards.push_back({begin, begin + size});
        begin += size;
    }
    return plan;
}

} // namespace store
} // namespace tokbench
