/**
 * @file render.hpp
 * @brief 割り当てのテキスト出力
 */
#ifndef CROSSWORD_CSP_RENDER_HPP
#define CROSSWORD_CSP_RENDER_HPP

#include "crossword_csp/puzzle.hpp"
#include "crossword_csp/solver.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace crossword_csp {

/**
 * @brief 割り当てを文字グリッドに展開
 *
 * 各行は width 文字。割り当てのある開セルは文字、それ以外は '\0'。
 */
std::vector<std::string> letter_grid(const Puzzle& puzzle, const Assignment& assignment);

/**
 * @brief テキストで出力（ブロックは "█"、未記入の開セルは空白）
 */
void print_assignment(std::ostream& os, const Puzzle& puzzle, const Assignment& assignment);

/**
 * @brief テキスト出力をファイルに保存
 * @throws std::runtime_error ファイルを開けない
 */
void save_assignment(const std::string& filename, const Puzzle& puzzle,
                     const Assignment& assignment);

} // namespace crossword_csp

#endif // CROSSWORD_CSP_RENDER_HPP
