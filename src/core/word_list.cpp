#include "crossword_csp/word_list.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace crossword_csp {

WordList::WordList(std::vector<std::string> words) {
    for (auto& w : words) {
        w = to_upper(std::move(w));
    }
    words.erase(std::remove_if(words.begin(), words.end(),
                               [](const std::string& w) { return w.empty(); }),
                words.end());
    std::sort(words.begin(), words.end());
    words.erase(std::unique(words.begin(), words.end()), words.end());
    words_ = std::move(words);
}

const std::string& WordList::word(WordId id) const {
    if (id >= words_.size()) {
        throw std::out_of_range("Word ID out of range");
    }
    return words_[id];
}

std::optional<WordId> WordList::find(const std::string& word) const {
    auto key = to_upper(word);
    auto it = std::lower_bound(words_.begin(), words_.end(), key);
    if (it == words_.end() || *it != key) {
        return std::nullopt;
    }
    return static_cast<WordId>(it - words_.begin());
}

size_t WordList::max_length() const {
    size_t result = 0;
    for (const auto& w : words_) {
        result = std::max(result, w.size());
    }
    return result;
}

std::string to_upper(std::string word) {
    std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return word;
}

WordList parse_word_list(std::istream& in) {
    std::vector<std::string> words;
    std::string token;
    while (in >> token) {
        words.push_back(token);
    }
    return WordList(std::move(words));
}

WordList read_word_list_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    return parse_word_list(file);
}

} // namespace crossword_csp
