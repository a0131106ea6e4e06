/**
 * @file grid.hpp
 * @brief クロスワードのグリッド（開セル / ブロックセル）と構造ファイルの読み込み
 */
#ifndef CROSSWORD_CSP_GRID_HPP
#define CROSSWORD_CSP_GRID_HPP

#include <cstddef>
#include <istream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace crossword_csp {

/**
 * @brief グリッドが不正（非矩形、未知の文字）
 */
class MalformedGridError : public std::runtime_error {
public:
    explicit MalformedGridError(const std::string& what)
        : std::runtime_error("Malformed grid: " + what) {}
};

/**
 * @brief 不変の2次元グリッド
 *
 * 各セルは開セル ('_') かブロックセル ('#')。
 * 生成後は変更されない。
 */
class Grid {
public:
    static constexpr char OPEN_CELL = '_';
    static constexpr char BLOCKED_CELL = '#';

    /**
     * @brief 空のグリッド（0 x 0）
     */
    Grid() = default;

    /**
     * @brief 行の文字列からグリッドを作成
     * @param rows 各行（'_' = 開、'#' = ブロック）
     * @throws MalformedGridError 行幅が揃っていない、または未知の文字を含む
     */
    static Grid from_rows(const std::vector<std::string>& rows);

    size_t height() const { return height_; }
    size_t width() const { return width_; }

    /**
     * @brief セルが開いているか（範囲外は false）
     */
    bool is_open(size_t row, size_t col) const {
        return row < height_ && col < width_ && cells_[row * width_ + col];
    }

    /**
     * @brief 開セル数
     */
    size_t open_count() const;

private:
    Grid(size_t height, size_t width, std::vector<bool> cells)
        : height_(height), width_(width), cells_(std::move(cells)) {}

    size_t height_ = 0;
    size_t width_ = 0;
    std::vector<bool> cells_;
};

/**
 * @brief ストリームからグリッドを読み込む
 *
 * 1行が1グリッド行。末尾の '\r' と末尾の空行は無視する。
 *
 * @throws MalformedGridError
 */
Grid parse_grid(std::istream& in);

/**
 * @brief ファイルからグリッドを読み込む
 * @throws std::runtime_error ファイルを開けない
 * @throws MalformedGridError
 */
Grid read_grid_file(const std::string& filename);

} // namespace crossword_csp

#endif // CROSSWORD_CSP_GRID_HPP
