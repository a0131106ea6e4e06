#include "crossword_csp/render.hpp"
#include <fstream>
#include <stdexcept>

namespace crossword_csp {

std::vector<std::string> letter_grid(const Puzzle& puzzle, const Assignment& assignment) {
    const auto& grid = puzzle.grid();
    std::vector<std::string> letters(grid.height(), std::string(grid.width(), '\0'));
    for (const auto& [var, word] : assignment) {
        for (size_t k = 0; k < word.size() && k < var.length; ++k) {
            letters[var.row_at(k)][var.col_at(k)] = word[k];
        }
    }
    return letters;
}

void print_assignment(std::ostream& os, const Puzzle& puzzle, const Assignment& assignment) {
    const auto& grid = puzzle.grid();
    auto letters = letter_grid(puzzle, assignment);
    for (size_t r = 0; r < grid.height(); ++r) {
        for (size_t c = 0; c < grid.width(); ++c) {
            if (grid.is_open(r, c)) {
                os << (letters[r][c] != '\0' ? letters[r][c] : ' ');
            } else {
                os << "█";
            }
        }
        os << "\n";
    }
}

void save_assignment(const std::string& filename, const Puzzle& puzzle,
                     const Assignment& assignment) {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    print_assignment(file, puzzle, assignment);
}

} // namespace crossword_csp
