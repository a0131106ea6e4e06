#include "crossword_csp/puzzle.hpp"
#include <stdexcept>

namespace crossword_csp {

Puzzle::Puzzle(Grid grid)
    : grid_(std::move(grid)) {
    derive_variables();
    compute_overlaps();
}

void Puzzle::derive_variables() {
    const size_t height = grid_.height();
    const size_t width = grid_.width();

    // 横: 行優先で極大区間を走査
    for (size_t r = 0; r < height; ++r) {
        size_t c = 0;
        while (c < width) {
            if (!grid_.is_open(r, c)) {
                ++c;
                continue;
            }
            size_t start = c;
            while (c < width && grid_.is_open(r, c)) {
                ++c;
            }
            if (c - start >= 2) {
                variables_.push_back({r, start, Direction::Across, c - start});
            }
        }
    }

    // 縦: 列優先
    for (size_t c = 0; c < width; ++c) {
        size_t r = 0;
        while (r < height) {
            if (!grid_.is_open(r, c)) {
                ++r;
                continue;
            }
            size_t start = r;
            while (r < height && grid_.is_open(r, c)) {
                ++r;
            }
            if (r - start >= 2) {
                variables_.push_back({start, c, Direction::Down, r - start});
            }
        }
    }

    for (size_t i = 0; i < variables_.size(); ++i) {
        index_[variables_[i]] = i;
    }
}

void Puzzle::compute_overlaps() {
    const size_t n = variables_.size();
    overlaps_.assign(n * n, std::nullopt);
    neighbors_.assign(n, {});

    // (i, j) を i < j の順に走査するので neighbors_ は昇順になる

    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            const auto& v1 = variables_[i];
            const auto& v2 = variables_[j];

            // 同方向の極大区間はブロックセルで隔てられるので重ならない
            if (v1.direction == v2.direction) {
                continue;
            }

            const auto& across = v1.direction == Direction::Across ? v1 : v2;
            const auto& down = v1.direction == Direction::Across ? v2 : v1;

            // 交点は (across.row, down.col)
            if (down.col < across.col || down.col >= across.col + across.length) continue;
            if (across.row < down.row || across.row >= down.row + down.length) continue;

            size_t across_pos = down.col - across.col;
            size_t down_pos = across.row - down.row;

            Overlap o = (v1.direction == Direction::Across) ?Overlap{across_pos, down_pos}
                                         : Overlap{down_pos, across_pos};
            overlaps_[i * n + j] = o;
            overlaps_[j * n + i] = Overlap{o.second, o.first};
            neighbors_[i].push_back(j);
            neighbors_[j].push_back(i);
        }
    }
}

const Variable& Puzzle::variable(size_t idx) const {
    if (idx >= variables_.size()) {
        throw std::out_of_range("Variable index out of range");
    }
    return variables_[idx];
}

size_t Puzzle::index_of(const Variable& var) const {
    auto it = index_.find(var);
    if (it == index_.end()) {
        throw std::out_of_range("Variable not found: " + to_string(var));
    }
    return it->second;
}

PuzzlePtr load_puzzle(const std::string& filename) {
    return std::make_shared<const Puzzle>(read_grid_file(filename));
}

} // namespace crossword_csp
