/**
 * @file word_list.hpp
 * @brief 候補単語リスト（大文字化・重複除去・ID付け）
 */
#ifndef CROSSWORD_CSP_WORD_LIST_HPP
#define CROSSWORD_CSP_WORD_LIST_HPP

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace crossword_csp {

/**
 * @brief 単語ID（WordList 内のインデックス）
 */
using WordId = size_t;

/**
 * @brief 候補単語の集合
 *
 * 単語は大文字化され、重複除去後に辞書順で並ぶ。
 * 単語IDはこの並びのインデックスで、リストの寿命の間は不変。
 */
class WordList {
public:
    WordList() = default;

    /**
     * @brief 単語リストを作成
     * @param words 候補単語（大文字小文字・重複は問わない）
     */
    explicit WordList(std::vector<std::string> words);

    size_t size() const { return words_.size(); }
    bool empty() const { return words_.empty(); }

    /**
     * @brief IDから単語を取得
     * @throws std::out_of_range
     */
    const std::string& word(WordId id) const;

    /**
     * @brief 全単語（辞書順）
     */
    const std::vector<std::string>& words() const { return words_; }

    /**
     * @brief 単語のIDを検索（大文字小文字は問わない）
     */
    std::optional<WordId> find(const std::string& word) const;

    /**
     * @brief 最長の単語の長さ
     */
    size_t max_length() const;

private:
    std::vector<std::string> words_;
};

/**
 * @brief 単語を大文字化
 */
std::string to_upper(std::string word);

/**
 * @brief 空白区切りの単語リストを読み込む
 */
WordList parse_word_list(std::istream& in);

/**
 * @brief ファイルから単語リストを読み込む
 * @throws std::runtime_error ファイルを開けない
 */
WordList read_word_list_file(const std::string& filename);

} // namespace crossword_csp

#endif // CROSSWORD_CSP_WORD_LIST_HPP
