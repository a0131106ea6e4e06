/**
 * @file model.hpp
 * @brief CSPモデルクラス（定義域・割り当て管理、集中Trail）
 */
#ifndef CROSSWORD_CSP_MODEL_HPP
#define CROSSWORD_CSP_MODEL_HPP

#include "crossword_csp/domain.hpp"
#include "crossword_csp/puzzle.hpp"
#include "crossword_csp/word_list.hpp"
#include <cstdint>
#include <utility>
#include <vector>

namespace crossword_csp {

/**
 * @brief 未割り当てを表す単語ID
 */
constexpr WordId UNASSIGNED = SIZE_MAX;

/**
 * @brief 変数状態用 Trail エントリ
 */
struct VarTrailEntry {
    size_t var_idx;
    size_t old_n;
    WordId old_assigned;
};

/**
 * @brief CSPモデル
 *
 * パズル構造と単語リストを保持し、変数ごとの定義域と現在の割り当てを管理する。
 * 全ての変更はセーブポイント付きで集中型 Trail に記録され、
 * rewind_to() で巻き戻す。初期状態はセーブポイント 0。
 */
class Model {
public:
    static constexpr int ROOT_SAVE_POINT = 0;

    /**
     * @brief モデルを作成（全変数の定義域 = 全単語）
     */
    Model(PuzzlePtr puzzle, WordList words);

    const Puzzle& puzzle() const { return *puzzle_; }
    const WordList& words() const { return words_; }

    /**
     * @brief 変数の数
     */
    size_t num_variables() const { return domains_.size(); }

    /**
     * @brief 変数の定義域を取得
     */
    const Domain& domain(size_t var_idx) const { return domains_[var_idx]; }

    /**
     * @brief 変数の定義域サイズ
     */
    size_t var_size(size_t var_idx) const { return domains_[var_idx].size(); }

    /**
     * @brief 単語の文字列
     */
    const std::string& word(WordId id) const { return words_.word(id); }

    // ===== 割り当て =====

    bool is_assigned(size_t var_idx) const { return assigned_[var_idx] != UNASSIGNED; }

    /**
     * @brief 割り当て済みの単語ID（未割り当てなら UNASSIGNED）
     */
    WordId assigned_word(size_t var_idx) const { return assigned_[var_idx]; }

    /**
     * @brief 割り当て済み変数の数（O(1)）
     */
    size_t assigned_count() const { return assigned_count_; }

    // ===== ドメイン操作（Trail 付き） =====

    /**
     * @brief 特定の単語を定義域から削除
     * @return 削除されたら true（元々無ければ false）
     */
    bool remove_value(int save_point, size_t var_idx, WordId value);

    /**
     * @brief 変数に単語を割り当て、定義域をその単語のみに絞る
     * @return 成功（単語が定義域に存在）したら true
     */
    bool instantiate(int save_point, size_t var_idx, WordId value);

    // ===== Trail 管理 =====

    /**
     * @brief 変数状態を Trail に保存（同じセーブポイントでは1回のみ）
     */
    void save_var_state(int save_point, size_t var_idx);

    /**
     * @brief 指定セーブポイントまで巻き戻す
     *
     * save_point より大きいセーブポイントで記録された変更を全て取り消す。
     */
    void rewind_to(int save_point);

    /**
     * @brief 初期状態（全単語の定義域、割り当てなし）に戻す
     */
    void reset() { rewind_to(ROOT_SAVE_POINT); }

    /**
     * @brief 変数 Trail のサイズを取得
     */
    size_t var_trail_size() const { return var_trail_.size(); }

private:
    PuzzlePtr puzzle_;
    WordList words_;

    std::vector<Domain> domains_;
    std::vector<WordId> assigned_;
    std::vector<int> last_saved_level_;
    size_t assigned_count_ = 0;

    // 集中 Trail
    std::vector<std::pair<int, VarTrailEntry>> var_trail_;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_MODEL_HPP
