#include "pawn_tour/moves.hpp"

namespace pawn_tour {

const std::vector<Offset>& pawn_moves() {
    // E, NE, N, NW, W, SW, S, SE
    static const std::vector<Offset> moves = {
        {0, 3}, {-2, 2}, {-3, 0}, {-2, -2},
        {0, -3}, {2, -2}, {3, 0}, {2, 2}
    };
    return moves;
}

} // namespace pawn_tour
