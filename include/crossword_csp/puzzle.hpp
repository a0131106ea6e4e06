/**
 * @file puzzle.hpp
 * @brief パズル構造（変数集合と重なり関係）
 */
#ifndef CROSSWORD_CSP_PUZZLE_HPP
#define CROSSWORD_CSP_PUZZLE_HPP

#include "crossword_csp/grid.hpp"
#include "crossword_csp/variable.hpp"
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace crossword_csp {

/**
 * @brief 2変数が共有するセルの位置
 *
 * first は v1 内のインデックス、second は v2 内のインデックス。
 */
struct Overlap {
    size_t first;
    size_t second;

    bool operator==(const Overlap& other) const {
        return first == other.first && second == other.second;
    }
};

/**
 * @brief グリッドから導出したパズル構造
 *
 * 変数の列挙順は、横変数（行優先）の後に縦変数（列優先）。
 * 重なり関係は構築時に一度だけ計算し、以後変更しない。
 */
class Puzzle {
public:
    /**
     * @brief グリッドから変数と重なりを導出
     */
    explicit Puzzle(Grid grid);

    const Grid& grid() const { return grid_; }

    /**
     * @brief 変数リストを取得
     */
    const std::vector<Variable>& variables() const { return variables_; }

    /**
     * @brief インデックスで変数を取得
     * @throws std::out_of_range
     */
    const Variable& variable(size_t idx) const;

    /**
     * @brief 変数のインデックスを取得
     * @throws std::out_of_range パズルに含まれない変数
     */
    size_t index_of(const Variable& var) const;

    /**
     * @brief 変数 i と j の重なり（(i内の位置, j内の位置)）
     *
     * 対称: overlap(j, i) は overlap(i, j) の first/second を入れ替えたもの。
     */
    const std::optional<Overlap>& overlap(size_t i, size_t j) const {
        return overlaps_[i * variables_.size() + j];
    }

    /**
     * @brief 重なりを持つ変数のインデックス（昇順）
     */
    const std::vector<size_t>& neighbors(size_t idx) const { return neighbors_[idx]; }

    /**
     * @brief 次数（隣接変数の数）
     */
    size_t degree(size_t idx) const { return neighbors_[idx].size(); }

private:
    void derive_variables();
    void compute_overlaps();

    Grid grid_;
    std::vector<Variable> variables_;
    std::unordered_map<Variable, size_t> index_;
    std::vector<std::optional<Overlap>> overlaps_;  // n x n
    std::vector<std::vector<size_t>> neighbors_;
};

using PuzzlePtr = std::shared_ptr<const Puzzle>;

/**
 * @brief 構造ファイルからパズルを作成
 * @throws std::runtime_error ファイルを開けない
 * @throws MalformedGridError
 */
PuzzlePtr load_puzzle(const std::string& filename);

} // namespace crossword_csp

#endif // CROSSWORD_CSP_PUZZLE_HPP
