#pragma once
#include <string>
#include <unordered_set>
#include "../word_tokenizer.hpp"

namespace tokbench {

/**
 * @brief Dictionary segmenter using forward maximum matching.
 *
 * The dictionary is a text file with one entry per line in the jieba layout
 * "word [frequency [tag]]"; only the first field is used. Within each
 * white-space separated run the longest dictionary word starting at the
 * current position is emitted, falling back to a single code point.
 */
class MaxMatchTokenizer : public WordTokenizer {
public:
    MaxMatchTokenizer(Language language, std::string dictionary_path, bool filter_foreign_tokens = true);

    size_t dictionary_size() const { return dictionary_.size(); }
    size_t max_word_length() const { return max_word_length_; }

protected:
    void setup() override;
    std::vector<std::string> do_tokenize(const std::string& text) override;

private:
    std::string dictionary_path_;
    std::unordered_set<std::u32string> dictionary_;
    size_t max_word_length_ = 0;

    void segment_run(const std::u32string& run, std::vector<std::string>& tokens) const;
};

} // namespace tokbench
