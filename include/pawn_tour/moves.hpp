/**
 * @file moves.hpp
 * @brief ポーンの移動パターン（Move Catalog）
 */
#ifndef PAWN_TOUR_MOVES_HPP
#define PAWN_TOUR_MOVES_HPP

#include "pawn_tour/types.hpp"
#include <vector>

namespace pawn_tour {

/**
 * @brief ポーンの移動パターンを取得
 *
 * 東西南北へ3マス、斜め4方向へ2マスの計8通り。
 * 列挙順は同じ degree の候補のタイブレークに使われるため固定。
 * プロセス内で一度だけ構築され、常に同じオブジェクトを返す。
 */
const std::vector<Offset>& pawn_moves();

} // namespace pawn_tour

#endif // PAWN_TOUR_MOVES_HPP
