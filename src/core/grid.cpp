#include "crossword_csp/grid.hpp"
#include <algorithm>
#include <fstream>

namespace crossword_csp {

Grid Grid::from_rows(const std::vector<std::string>& rows) {
    if (rows.empty()) {
        return Grid();
    }

    size_t height = rows.size();
    size_t width = rows.front().size();
    std::vector<bool> cells;
    cells.reserve(height * width);

    for (size_t r = 0; r < height; ++r) {
        const auto& row = rows[r];
        if (row.size() != width) {
            throw MalformedGridError("row " + std::to_string(r) + " has width " +
                                     std::to_string(row.size()) + ", expected " +
                                     std::to_string(width));
        }
        for (size_t c = 0; c < width; ++c) {
            char ch = row[c];
            if (ch == OPEN_CELL) {
                cells.push_back(true);
            } else if (ch == BLOCKED_CELL) {
                cells.push_back(false);
            } else {
                throw MalformedGridError("unexpected character '" + std::string(1, ch) +
                                         "' at row " + std::to_string(r) +
                                         ", column " + std::to_string(c));
            }
        }
    }

    return Grid(height, width, std::move(cells));
}

size_t Grid::open_count() const {
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), true));
}

Grid parse_grid(std::istream& in) {
    std::vector<std::string> rows;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        rows.push_back(line);
    }

    // 末尾の空行は無視
    while (!rows.empty() && rows.back().empty()) {
        rows.pop_back();
    }

    return Grid::from_rows(rows);
}

Grid read_grid_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    return parse_grid(file);
}

} // namespace crossword_csp
