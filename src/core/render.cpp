#include "pawn_tour/render.hpp"
#include <cstdio>

namespace pawn_tour {

std::string format_board(const Board& board) {
    const int n = board.dimension();
    std::string out;
    out.reserve(board.cell_count() * 3 + static_cast<size_t>(n));
    char buf[16];
    for (int row = 0; row < n; ++row) {
        for (int col = 0; col < n; ++col) {
            std::snprintf(buf, sizeof(buf), "%3d", board.at(Cell{row, col}));
            out += buf;
        }
        out += '\n';
    }
    return out;
}

std::string format_cell(const Cell& cell) {
    return "[row:" + std::to_string(cell.row) + ", column:" + std::to_string(cell.col) + "]";
}

} // namespace pawn_tour
