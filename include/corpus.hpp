#pragma once
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>
#include "types.hpp"

namespace tokbench {

/**
 * @brief Byte offsets of every line start in a newline-delimited corpus file.
 *
 * Built once per run; readers use it to seek straight to a sentence offset,
 * which is what lets a resumed shard start in the middle of the file.
 */
class CorpusIndex {
public:
    // Throws LoadError if the file cannot be read.
    static CorpusIndex build(const std::string& path);

    const std::string& path() const { return path_; }
    uint64_t size() const { return line_starts_.size(); }
    uint64_t file_size() const { return file_size_; }

    uint64_t line_start(uint64_t offset) const { return line_starts_.at(offset); }
    // Raw byte length of a line including its terminator.
    uint64_t line_span(uint64_t offset) const;

private:
    std::string path_;
    std::vector<uint64_t> line_starts_;
    uint64_t file_size_ = 0;
};

/**
 * @brief Random-access line reader over an indexed corpus. One per worker.
 */
class CorpusReader {
public:
    CorpusReader(const CorpusIndex& index, size_t max_line_bytes);

    /**
     * @brief Loads one sentence.
     * @throws LoadError for an out-of-range offset, a line with a NUL byte or
     * a line longer than max_line_bytes.
     */
    Sentence read(uint64_t offset, Language language);

    // Line text without its terminator and without validation.
    std::string read_line(uint64_t offset);

    uint64_t size() const { return index_.size(); }

private:
    const CorpusIndex& index_;
    size_t max_line_bytes_;
    std::ifstream file_;
};

// Splits running text at the language's sentence terminators, keeping the
// terminator with its sentence. Segments are trimmed; empty ones are dropped.
std::vector<std::string> split_segments(const std::string& text, Language language);

struct PrepareStats {
    uint64_t lines_read = 0;
    uint64_t sentences_written = 0;
    uint64_t invalid_lines = 0;
};

/**
 * @brief Turns a plain text file into a one-sentence-per-line corpus.
 *
 * Lines that are not valid UTF-8 are logged and left out.
 * @throws LoadError if input cannot be read or output cannot be written.
 */
PrepareStats prepare_corpus(const std::string& input_path, const std::string& output_path, Language language);

/**
 * @brief Copies `count` lines chosen uniformly without replacement, in their
 * original order. The same seed selects the same lines.
 * @throws ConfigError if count exceeds the number of lines.
 */
uint64_t sample_corpus(const std::string& input_path, const std::string& output_path,
                       uint64_t count, uint64_t seed);

} // namespace tokbench
