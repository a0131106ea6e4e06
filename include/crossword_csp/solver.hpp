/**
 * @file solver.hpp
 * @brief CSPソルバークラス（ノード整合・AC-3・MRV/次数/LCV 付きバックトラック探索）
 */
#ifndef CROSSWORD_CSP_SOLVER_HPP
#define CROSSWORD_CSP_SOLVER_HPP

#include "crossword_csp/model.hpp"
#include <atomic>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace crossword_csp {

/**
 * @brief 解を表す型（変数 -> 単語）
 */
using Assignment = std::map<Variable, std::string>;

/**
 * @brief 有向アーク (x, y): x を y に対してアーク整合にする
 */
using Arc = std::pair<size_t, size_t>;

/**
 * @brief 探索結果
 */
enum class SearchResult {
    SAT,      // 解が見つかった
    UNSAT,    // 解が存在しない
    UNKNOWN   // 不明（停止要求・ノード上限）
};

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t node_count = 0;
    size_t fail_count = 0;
    size_t max_depth = 0;
    size_t revise_count = 0;
    size_t pruned_count = 0;
};

/**
 * @brief クロスワード用CSPソルバー
 *
 * 以下の手順で解く：
 * - ノード整合（単語長の単項制約）
 * - AC-3 による探索前のアーク整合
 * - MRV + 次数ヒューリスティックによる変数選択
 * - LCV による値順序
 * - 割り当てごとの伝播（単語の重複禁止 + AC-3）とTrailによる巻き戻し
 */
class Solver {
public:
    Solver() = default;

    /**
     * @brief 解を探索
     *
     * モデルを初期状態に戻してから解く。解が見つかった場合はモデルに
     * 解の状態が残り、見つからなかった場合は初期状態に巻き戻される。
     *
     * @param model 解くモデル
     * @return 解が見つかればその割り当て、なければstd::nullopt
     */
    std::optional<Assignment> solve(Model& model);

    /**
     * @brief 直前の solve() の結果
     */
    SearchResult last_result() const { return last_result_; }

    // ===== 整合化 =====

    /**
     * @brief ノード整合: 長さが変数と異なる単語を定義域から除去
     * @return 全ての定義域が空でなければ true
     */
    bool enforce_node_consistency(Model& model, int save_point = 1);

    /**
     * @brief x を y に対してアーク整合にする
     *
     * 重なり (i, j) について、y の定義域に j 文字目が一致する単語が
     * 存在しない x の単語を除去する。
     *
     * @return x の定義域が変化したら true
     */
    bool revise(Model& model, size_t x, size_t y, int save_point = 1);

    /**
     * @brief 全アークで AC-3 を実行
     * @return 空の定義域が生じなければ true
     */
    bool ac3(Model& model, int save_point = 1);

    /**
     * @brief 指定アークから AC-3 を実行
     */
    bool ac3(Model& model, std::deque<Arc> arcs, int save_point);

    // ===== 検査 =====

    /**
     * @brief 全変数が割り当て済みか
     */
    bool is_complete(const Model& model) const;

    /**
     * @brief 割り当て済み変数の集合が整合しているか
     *
     * 長さ一致、単語の重複なし、重なり文字の一致を確認する。
     */
    bool is_consistent(const Model& model) const;

    /**
     * @brief var に word を置いた場合に既存の割り当てと整合するか
     */
    bool is_consistent_with(const Model& model, size_t var, WordId word) const;

    // ===== ヒューリスティック =====

    /**
     * @brief 次に割り当てる変数を選択（MRV、同点は次数最大、さらに同点はインデックス最小）
     * @return 変数インデックス。全て割り当て済みなら SIZE_MAX
     */
    size_t select_unassigned_variable(const Model& model) const;

    /**
     * @brief var の定義域を LCV 順に並べる（同点は単語ID順）
     */
    std::vector<WordId> order_domain_values(const Model& model, size_t var) const;

    // ===== 設定 =====

    /**
     * @brief 探索前の AC-3 を有効/無効にする
     */
    void set_arc_consistency(bool enabled) { arc_consistency_ = enabled; }

    /**
     * @brief 探索中の伝播（重複除去 + AC-3）を有効/無効にする
     */
    void set_maintain_arc_consistency(bool enabled) { maintain_arc_consistency_ = enabled; }

    /**
     * @brief LCV 値順序を有効/無効にする（無効時は単語ID順）
     */
    void set_lcv(bool enabled) { lcv_ = enabled; }

    /**
     * @brief 探索ノード数の上限（0 = 無制限）
     */
    void set_node_limit(size_t limit) { node_limit_ = limit; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

private:
    /**
     * @brief バックトラック探索
     */
    SearchResult backtrack(Model& model, size_t depth);

    /**
     * @brief 割り当て後の伝播
     *
     * 単語を他の未割り当て変数の定義域から除去し、
     * 変化した変数へのアークを起点に AC-3 を実行する。
     */
    bool propagate_assignment(Model& model, size_t var, WordId word);

    /**
     * @brief モデルの割り当てから解を構築
     */
    Assignment build_assignment(const Model& model) const;

    std::atomic<bool> stopped_{false};
    bool verbose_ = false;

    // 設定
    bool arc_consistency_ = true;
    bool maintain_arc_consistency_ = true;
    bool lcv_ = true;
    size_t node_limit_ = 0;

    // 状態
    int current_decision_ = 0;
    SearchResult last_result_ = SearchResult::UNKNOWN;

    // 統計
    SolverStats stats_;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_SOLVER_HPP
