#include "../include/vocabulary.hpp"
#include "../include/errors.hpp"
#include "../include/logger.hpp"
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <utility>

namespace tokbench {

GroundTruthVocabulary::GroundTruthVocabulary(Language language) : language_(language) {}

GroundTruthVocabulary GroundTruthVocabulary::load_from_file(const std::string& path, Language language) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw LoadError("Could not open vocabulary file: " + path);
    }

    std::string extension = std::filesystem::path(path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const bool is_csv = extension == ".csv";

    GroundTruthVocabulary vocabulary(language);
    std::string line;
    size_t line_number = 0;
    size_t duplicates = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::string word = is_csv ? first_csv_field(line) : line;
        if (line_number == 1 && word == "Words") {
            continue;
        }
        if (word.empty()) {
            continue;
        }
        if (!vocabulary.add(word)) {
            ++duplicates;
        }
    }

    log_info("Loaded " + std::to_string(vocabulary.size()) + " " + language_code(language) +
             " vocabulary words from " + path + " (" + std::to_string(duplicates) +
             " duplicates or empty after normalization)");
    return vocabulary;
}

bool GroundTruthVocabulary::add(const std::string& word) {
    std::string normalized = normalizer_.normalize(word);
    if (normalized.empty()) {
        return false;
    }
    return words_.insert(std::move(normalized)).second;
}

bool GroundTruthVocabulary::contains(const std::string& token) const {
    return contains_normalized(normalizer_.normalize(token));
}

bool GroundTruthVocabulary::contains_normalized(const std::string& normalized_token) const {
    return words_.find(normalized_token) != words_.end();
}

std::string GroundTruthVocabulary::first_csv_field(const std::string& line) {
    if (line.empty()) {
        return line;
    }
    if (line.front() != '"') {
        return line.substr(0, line.find(','));
    }

    // Quoted field, "" is an escaped quote
    std::string field;
    for (size_t i = 1; i < line.size(); ++i) {
        if (line[i] == '"') {
            if (i + 1 < line.size() && line[i + 1] == '"') {
                field.push_back('"');
                ++i;
            } else {
                break;
            }
        } else {
            field.push_back(line[i]);
        }
    }
    return field;
}

} // namespace tokbench
