#include "../../include/tokenizers/max_match_tokenizer.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/unicode_utils.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace tokbench {

MaxMatchTokenizer::MaxMatchTokenizer(Language language, std::string dictionary_path, bool filter_foreign_tokens)
    : WordTokenizer("maxmatch", language, filter_foreign_tokens), dictionary_path_(std::move(dictionary_path)) {}

void MaxMatchTokenizer::setup() {
    if (dictionary_path_.empty()) {
        throw TokenizerInitError("maxmatch: no dictionary_path configured");
    }
    std::ifstream file(dictionary_path_);
    if (!file.is_open()) {
        throw TokenizerInitError("maxmatch: could not open dictionary " + dictionary_path_);
    }

    std::string line;
    size_t invalid_lines = 0;
    while (std::getline(file, line)) {
        std::istringstream fields(line);
        std::string word;
        if (!(fields >> word)) {
            continue;
        }
        auto code_points = decode_utf8(word);
        if (!code_points) {
            ++invalid_lines;
            continue;
        }
        max_word_length_ = std::max(max_word_length_, code_points->size());
        dictionary_.insert(std::move(*code_points));
    }

    if (dictionary_.empty()) {
        throw TokenizerInitError("maxmatch: dictionary " + dictionary_path_ + " has no entries");
    }
    if (invalid_lines > 0) {
        log_warning("maxmatch: skipped " + std::to_string(invalid_lines) + " ill-formed dictionary lines in " +
                    dictionary_path_);
    }
    log_info("maxmatch: loaded " + std::to_string(dictionary_.size()) + " dictionary words, longest " +
             std::to_string(max_word_length_) + " code points");
}

std::vector<std::string> MaxMatchTokenizer::do_tokenize(const std::string& text) {
    auto code_points = decode_utf8(text);
    if (!code_points) {
        throw TokenizerRuntimeError("maxmatch: ill-formed UTF-8 input");
    }

    std::vector<std::string> tokens;
    std::u32string run;
    for (char32_t c : *code_points) {
        if (is_white_space(c)) {
            segment_run(run, tokens);
            run.clear();
        } else {
            run.push_back(c);
        }
    }
    segment_run(run, tokens);
    return tokens;
}

void MaxMatchTokenizer::segment_run(const std::u32string& run, std::vector<std::string>& tokens) const {
    size_t position = 0;
    while (position < run.size()) {
        size_t length = std::min(max_word_length_, run.size() - position);
        for (; length > 1; --length) {
            if (dictionary_.count(run.substr(position, length)) > 0) {
                break;
            }
        }
        length = std::max<size_t>(length, 1);
        tokens.push_back(encode_utf8(run.substr(position, length)));
        position += length;
    }
}

} // namespace tokbench
