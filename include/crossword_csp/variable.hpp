/**
 * @file variable.hpp
 * @brief クロスワードの変数（スロット）
 */
#ifndef CROSSWORD_CSP_VARIABLE_HPP
#define CROSSWORD_CSP_VARIABLE_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <tuple>

namespace crossword_csp {

/**
 * @brief スロットの向き
 */
enum class Direction {
    Across,  // 横
    Down     // 縦
};

/**
 * @brief 向きを文字列で取得（"across" / "down"）
 */
const char* to_string(Direction direction);

/**
 * @brief CSP変数（グリッド上のスロット）
 *
 * 一方向に連続する開セルの極大区間（長さ2以上）。
 * 4属性すべてが一致するとき等しい値型。
 */
struct Variable {
    size_t row;
    size_t col;
    Direction direction;
    size_t length;

    /**
     * @brief k 文字目が置かれるセルの行
     */
    size_t row_at(size_t k) const { return direction == Direction::Down ? row + k : row; }

    /**
     * @brief k 文字目が置かれるセルの列
     */
    size_t col_at(size_t k) const { return direction == Direction::Across ? col + k : col; }

    bool operator==(const Variable& other) const {
        return row == other.row && col == other.col &&
               direction == other.direction && length == other.length;
    }

    bool operator!=(const Variable& other) const { return !(*this == other); }

    bool operator<(const Variable& other) const {
        return std::tie(row, col, direction, length) <
               std::tie(other.row, other.col, other.direction, other.length);
    }
};

/**
 * @brief デバッグ・ログ用表記 "(row, col) across 5"
 */
std::string to_string(const Variable& var);

} // namespace crossword_csp

namespace std {

template<>
struct hash<crossword_csp::Variable> {
    size_t operator()(const crossword_csp::Variable& v) const noexcept {
        size_t h = std::hash<size_t>()(v.row);
        h = h * 31 + std::hash<size_t>()(v.col);
        h = h * 31 + static_cast<size_t>(v.direction);
        h = h * 31 + std::hash<size_t>()(v.length);
        return h;
    }
};

} // namespace std

#endif // CROSSWORD_CSP_VARIABLE_HPP
