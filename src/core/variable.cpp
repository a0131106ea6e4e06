#include "crossword_csp/variable.hpp"

namespace crossword_csp {

const char* to_string(Direction direction) {
    return direction == Direction::Across ? "across" : "down";
}

std::string to_string(const Variable& var) {
    return "(" + std::to_string(var.row) + ", " + std::to_string(var.col) + ") " +
           to_string(var.direction) + " " + std::to_string(var.length);
}

} // namespace crossword_csp
