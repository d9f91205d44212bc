/**
 * @file types.hpp
 * @brief 基本型（Offset, Cell）
 */
#ifndef PAWN_TOUR_TYPES_HPP
#define PAWN_TOUR_TYPES_HPP

#include <ostream>

namespace pawn_tour {

/**
 * @brief 相対移動量
 *
 * dx は行方向、dy は列方向の移動量。
 */
struct Offset {
    int dx;
    int dy;

    bool operator==(const Offset& other) const {
        return dx == other.dx && dy == other.dy;
    }
    bool operator!=(const Offset& other) const { return !(*this == other); }
};

/**
 * @brief 盤面上の絶対位置（行, 列）
 */
struct Cell {
    int row;
    int col;

    bool operator==(const Cell& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

/**
 * @brief 現在位置に移動量を加えた候補位置
 */
inline Cell operator+(const Cell& cell, const Offset& offset) {
    return Cell{cell.row + offset.dx, cell.col + offset.dy};
}

inline std::ostream& operator<<(std::ostream& os, const Cell& cell) {
    return os << "(" << cell.row << ", " << cell.col << ")";
}

} // namespace pawn_tour

#endif // PAWN_TOUR_TYPES_HPP
