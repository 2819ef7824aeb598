#include "../include/corpus.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include "../include/unicode_utils.hpp"
#include <algorithm>
#include <iterator>
#include <limits>
#include <numeric>
#include <optional>
#include <random>
#include <utility>
#include <unicode/utf8.h>

namespace tokbench {

namespace {

constexpr size_t INDEX_READ_CHUNK = 1 << 20;

bool is_terminator(char32_t c, Language language) {
    switch (language) {
        case Language::Urdu:
            return c == 0x06D4 || c == 0x061F || c == U'!' || c == U'?';
        case Language::Hindi:
            return c == 0x0964 || c == 0x0965 || c == U'!' || c == U'?';
        case Language::Chinese:
            return c == 0x3002 || c == 0xFF01 || c == 0xFF1F;
    }
    return false;
}

std::string trim_white_space(const std::string& text) {
    std::optional<std::u32string> code_points = decode_utf8(text);
    if (!code_points) {
        const char* ascii_space = " \t\r\n\f\v";
        size_t first = text.find_first_not_of(ascii_space);
        if (first == std::string::npos) {
            return std::string();
        }
        return text.substr(first, text.find_last_not_of(ascii_space) - first + 1);
    }
    const std::u32string& cps = *code_points;
    size_t first = 0;
    while (first < cps.size() && is_white_space(cps[first])) {
        ++first;
    }
    size_t last = cps.size();
    while (last > first && is_white_space(cps[last - 1])) {
        --last;
    }
    return encode_utf8(cps.substr(first, last - first));
}

void strip_terminator(std::string& line) {
    if (!line.empty() && line.back() == '\n') {
        line.pop_back();
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // namespace

CorpusIndex CorpusIndex::build(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw LoadError("Could not open corpus file: " + path);
    }

    CorpusIndex index;
    index.path_ = path;

    std::vector<char> buffer(INDEX_READ_CHUNK);
    uint64_t position = 0;
    bool at_line_start = true;
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = file.gcount();
        for (std::streamsize i = 0; i < got; ++i) {
            if (at_line_start) {
                index.line_starts_.push_back(position + static_cast<uint64_t>(i));
                at_line_start = false;
            }
            if (buffer[static_cast<size_t>(i)] == '\n') {
                at_line_start = true;
            }
        }
        position += static_cast<uint64_t>(got);
    }
    if (file.bad()) {
        throw LoadError("Failed reading corpus file: " + path);
    }
    index.file_size_ = position;

    log_info("Indexed " + std::to_string(index.size()) + " lines (" + std::to_string(position) +
             " bytes) in " + path);
    return index;
}

uint64_t CorpusIndex::line_span(uint64_t offset) const {
    uint64_t start = line_starts_.at(offset);
    uint64_t end = offset + 1 < line_starts_.size() ? line_starts_[offset + 1] : file_size_;
    return end - start;
}

CorpusReader::CorpusReader(const CorpusIndex& index, size_t max_line_bytes)
    : index_(index), max_line_bytes_(max_line_bytes), file_(index.path(), std::ios::binary) {
    if (!file_.is_open()) {
        throw LoadError("Could not open corpus file: " + index.path());
    }
}

std::string CorpusReader::read_line(uint64_t offset) {
    if (offset >= index_.size()) {
        throw LoadError("Offset " + std::to_string(offset) + " is past the end of " + index_.path() +
                        " (" + std::to_string(index_.size()) + " lines)");
    }
    std::string line(static_cast<size_t>(index_.line_span(offset)), '\0');
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(index_.line_start(offset)));
    if (!line.empty() && !file_.read(&line[0], static_cast<std::streamsize>(line.size()))) {
        throw LoadError("Could not read line " + std::to_string(offset) + " of " + index_.path());
    }
    strip_terminator(line);
    return line;
}

Sentence CorpusReader::read(uint64_t offset, Language language) {
    // Terminator bytes do not count towards the limit
    const uint64_t span = offset < index_.size() ? index_.line_span(offset) : 0;
    if (span > 2 && span - 2 > max_line_bytes_) {
        throw LoadError("Line " + std::to_string(offset) + " exceeds " + std::to_string(max_line_bytes_) + " bytes");
    }

    Sentence sentence;
    sentence.text = read_line(offset);
    sentence.language = language;
    sentence.offset = offset;

    if (sentence.text.size() > max_line_bytes_) {
        throw LoadError("Line " + std::to_string(offset) + " exceeds " + std::to_string(max_line_bytes_) + " bytes");
    }
    if (sentence.text.find('\0') != std::string::npos) {
        throw LoadError("Line " + std::to_string(offset) + " contains a NUL byte");
    }
    return sentence;
}

std::vector<std::string> split_segments(const std::string& text, Language language) {
    std::vector<std::string> segments;
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());

    int32_t segment_start = 0;
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(bytes, i, length, c);
        if (c >= 0 && is_terminator(static_cast<char32_t>(c), language)) {
            std::string segment = trim_white_space(text.substr(segment_start, i - segment_start));
            if (!segment.empty()) {
                segments.push_back(std::move(segment));
            }
            segment_start = i;
        }
    }
    std::string tail = trim_white_space(text.substr(segment_start));
    if (!tail.empty()) {
        segments.push_back(std::move(tail));
    }
    return segments;
}

PrepareStats prepare_corpus(const std::string& input_path, const std::string& output_path, Language language) {
    std::ifstream in(input_path, std::ios::binary);
    if (!in.is_open()) {
        throw LoadError("Could not open input file: " + input_path);
    }
    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw LoadError("Could not open output file: " + output_path);
    }

    PrepareStats stats;
    std::string line;
    while (std::getline(in, line)) {
        ++stats.lines_read;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!is_valid_utf8(line) || line.find('\0') != std::string::npos) {
            ++stats.invalid_lines;
            log_warning("Skipping invalid line " + std::to_string(stats.lines_read - 1) + " of " + input_path);
            continue;
        }
        for (const auto& segment : split_segments(line, language)) {
            out << segment << '\n';
            ++stats.sentences_written;
        }
    }
    out.flush();
    if (!out) {
        throw LoadError("Failed writing " + output_path);
    }

    log_info("Prepared " + std::to_string(stats.sentences_written) + " " + language_code(language) +
             " sentences from " + std::to_string(stats.lines_read) + " lines of " + input_path);
    return stats;
}

uint64_t sample_corpus(const std::string& input_path, const std::string& output_path,
                       uint64_t count, uint64_t seed) {
    CorpusIndex index = CorpusIndex::build(input_path);
    if (count > index.size()) {
        throw ConfigError("Cannot sample " + std::to_string(count) + " lines from " + input_path +
                          " which has " + std::to_string(index.size()));
    }

    std::vector<uint64_t> all(index.size());
    std::iota(all.begin(), all.end(), uint64_t{0});
    std::vector<uint64_t> chosen;
    chosen.reserve(count);
    std::mt19937_64 rng(seed);
    std::sample(all.begin(), all.end(), std::back_inserter(chosen), count, rng);

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw LoadError("Could not open output file: " + output_path);
    }
    CorpusReader reader(index, std::numeric_limits<size_t>::max());
    for (uint64_t offset : chosen) {
        out << reader.read_line(offset) << '\n';
    }
    out.flush();
    if (!out) {
        throw LoadError("Failed writing " + output_path);
    }

    log_info("Sampled " + std::to_string(chosen.size()) + " of " + std::to_string(index.size()) +
             " lines from " + input_path + " into " + output_path + " (seed " + std::to_string(seed) + ")");
    return chosen.size();
}

} // namespace tokbench
