#include "pawn_tour/board.hpp"
#include <stdexcept>
#include <string>

namespace pawn_tour {

namespace {
std::string cell_str(const Cell& cell) {
    return "(" + std::to_string(cell.row) + ", " + std::to_string(cell.col) + ")";
}
}  // namespace

Board::Board(int dimension, value_type unvisited_value)
    : dimension_(dimension), unvisited_(unvisited_value) {
    if (dimension <= 0) {
        throw std::invalid_argument("Board dimension must be positive: " +
                                    std::to_string(dimension));
    }
    if (unvisited_value > 0) {
        throw std::invalid_argument("Unvisited value must not be positive: " +
                                    std::to_string(unvisited_value));
    }
    markers_.assign(static_cast<size_t>(dimension) * static_cast<size_t>(dimension),
                    unvisited_);
}

Board::value_type Board::at(const Cell& cell) const {
    if (!contains(cell)) {
        throw std::out_of_range("Cell out of board: " + cell_str(cell));
    }
    return markers_[index(cell)];
}

void Board::mark(const Cell& cell, value_type step) {
    if (!contains(cell)) {
        throw std::out_of_range("Cell out of board: " + cell_str(cell));
    }
    if (step <= 0) {
        throw std::invalid_argument("Step number must be positive: " +
                                    std::to_string(step));
    }
    auto& marker = markers_[index(cell)];
    if (marker != unvisited_) {
        throw std::logic_error("Cell already visited: " + cell_str(cell));
    }
    marker = step;
    visited_++;
}

} // namespace pawn_tour
