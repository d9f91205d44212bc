/**
 * @file render.hpp
 * @brief 盤面・位置のテキスト表示
 */
#ifndef PAWN_TOUR_RENDER_HPP
#define PAWN_TOUR_RENDER_HPP

#include "pawn_tour/board.hpp"
#include <string>

namespace pawn_tour {

/**
 * @brief 盤面を文字列に整形
 *
 * 各マーカーを幅 3 で右寄せし、各行は改行で終わる。
 */
std::string format_board(const Board& board);

/**
 * @brief 位置を "[row:R, column:C]" 形式に整形
 */
std::string format_cell(const Cell& cell);

} // namespace pawn_tour

#endif // PAWN_TOUR_RENDER_HPP
