#pragma once
#include <cstdint>
#include <string>
#include "store_types.hpp"

namespace tokbench {
namespace store {

/**
 * Key layout: kind byte, length-prefixed language, length-prefixed tokenizer
 * id, then a big-endian offset for records and checkpoints. Lexicographic
 * byte order therefore equals (kind, language, tokenizer, offset) order.
 */
enum class KeyKind : uint8_t {
    Checkpoint = 'C',
    ShardPlan = 'P',
    Record = 'R'
};

std::string namespace_prefix(KeyKind kind, const std::string& language, const std::string& tokenizer_id);
std::string record_key(const std::string& language, const std::string& tokenizer_id, uint64_t offset);
std::string checkpoint_key(const std::string& language, const std::string& tokenizer_id, uint64_t shard_begin);
std::string shard_plan_key(const std::string& language, const std::string& tokenizer_id);

struct DecodedKey {
    KeyKind kind = KeyKind::Record;
    std::string language;
    std::string tokenizer_id;
    uint64_t offset = 0;  // unused for shard plans
};

// Throws StoreError on malformed keys.
DecodedKey decode_key(const std::string& key);

std::string encode_record(const StoredRecord& record);
StoredRecord decode_record(const std::string& value);

std::string encode_offset(uint64_t offset);
uint64_t decode_offset(const std::string& value);

std::string encode_shard_plan(const ShardPlan& plan);
ShardPlan decode_shard_plan(const std::string& value);

} // namespace store
} // namespace tokbench
