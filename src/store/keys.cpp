#include "../../include/store/keys.hpp"
#include "../../include/errors.hpp"
#include "../../include/serialization.hpp"

namespace tokbench {
namespace store {

using serialization::Deserializer;
using serialization::Serializer;

std::string namespace_prefix(KeyKind kind, const std::string& language, const std::string& tokenizer_id) {
    Serializer serializer;
    serializer.write_uint8(static_cast<uint8_t>(kind));
    serializer.write_string(language);
    serializer.write_string(tokenizer_id);
    return serializer.take_buffer();
}

std::string record_key(const std::string& language, const std::string& tokenizer_id, uint64_t offset) {
    Serializer serializer;
    serializer.write_raw(namespace_prefix(KeyKind::Record, language, tokenizer_id));
    serializer.write_uint64(offset);
    return serializer.take_buffer();
}

std::string checkpoint_key(const std::string& language, const std::string& tokenizer_id, uint64_t shard_begin) {
    Serializer serializer;
    serializer.write_raw(namespace_prefix(KeyKind::Checkpoint, language, tokenizer_id));
    serializer.write_uint64(shard_begin);
    return serializer.take_buffer();
}

std::string shard_plan_key(const std::string& language, const std::string& tokenizer_id) {
    return namespace_prefix(KeyKind::ShardPlan, language, tokenizer_id);
}

DecodedKey decode_key(const std::string& key) {
    try {
        Deserializer deserializer(key);
        DecodedKey decoded;
        uint8_t kind = deserializer.read_uint8();
        if (kind != static_cast<uint8_t>(KeyKind::Record) &&
            kind != static_cast<uint8_t>(KeyKind::Checkpoint) &&
            kind != static_cast<uint8_t>(KeyKind::ShardPlan)) {
            throw StoreError("unknown key kind " + std::to_string(kind));
        }
        decoded.kind = static_cast<KeyKind>(kind);
        decoded.language = deserializer.read_string();
        decoded.tokenizer_id = deserializer.read_string();
        if (decoded.kind != KeyKind::ShardPlan) {
            decoded.offset = deserializer.read_uint64();
        }
        if (deserializer.has_more()) {
            throw StoreError("trailing bytes in key");
        }
        return decoded;
    } catch (const StoreError&) {
        throw;
    } catch (const std::exception& e) {
        throw StoreError(std::string("malformed key: ") + e.what());
    }
}

std::string encode_record(const StoredRecord& record) {
    Serializer serializer;
    serializer.write_uint64(record.hits);
    serializer.write_uint64(record.tokens);
    serializer.write_uint8(static_cast<uint8_t>(record.status));
    return serializer.take_buffer();
}

StoredRecord decode_record(const std::string& value) {
    try {
        Deserializer deserializer(value);
        StoredRecord record;
        record.hits = deserializer.read_uint64();
        record.tokens = deserializer.read_uint64();
        uint8_t status = deserializer.read_uint8();
        if (status > static_cast<uint8_t>(RecordStatus::Skipped)) {
            throw StoreError("unknown record status " + std::to_string(status));
        }
        record.status = static_cast<RecordStatus>(status);
        return record;
    } catch (const StoreError&) {
        throw;
    } catch (const std::exception& e) {
        throw StoreError(std::string("malformed record value: ") + e.what());
    }
}

std::string encode_offset(uint64_t offset) {
    Serializer serializer;
    serializer.write_uint64(offset);
    return serializer.take_buffer();
}

uint64_t decode_offset(const std::string& value) {
    try {
        Deserializer deserializer(value);
        return deserializer.read_uint64();
    } catch (const std::exception& e) {
        throw StoreError(std::string("malformed checkpoint value: ") + e.what());
    }
}

std::string encode_shard_plan(const ShardPlan& plan) {
    Serializer serializer;
    serializer.write_uint32(static_cast<uint32_t>(plan.shards.size()));
    for (const auto& shard : plan.shards) {
        serializer.write_uint64(shard.begin);
        serializer.write_uint64(shard.end);
    }
    return serializer.take_buffer();
}

ShardPlan decode_shard_plan(const std::string& value) {
    try {
        Deserializer deserializer(value);
        ShardPlan plan;
        uint32_t count = deserializer.read_uint32();
        for (uint32_t i = 0; i < count; ++i) {
            ShardRange shard;
            shard.begin = deserializer.read_uint64();
            shard.end = deserializer.read_uint64();
            plan.shards.push_back(shard);
        }
        return plan;
    } catch (const std::exception& e) {
        throw StoreError(std::string("malformed shard plan: ") + e.what());
    }
}

} // namespace store
} // namespace tokbench
