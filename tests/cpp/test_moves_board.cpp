#include <catch2/catch.hpp>
#include "pawn_tour/moves.hpp"
#include "pawn_tour/board.hpp"
#include "pawn_tour/render.hpp"
#include <cstdlib>
#include <stdexcept>

using namespace pawn_tour;

// ============================================================================
// Move catalog tests
// ============================================================================

TEST_CASE("pawn_moves has eight leaper offsets", "[moves]") {
    const auto& moves = pawn_moves();
    REQUIRE(moves.size() == 8);

    for (const auto& m : moves) {
        int ax = std::abs(m.dx);
        int ay = std::abs(m.dy);
        bool straight = (ax == 0 && ay == 3) || (ax == 3 && ay == 0);
        bool diagonal = (ax == 2 && ay == 2);
        REQUIRE((straight || diagonal));
    }
}

TEST_CASE("pawn_moves order is fixed", "[moves]") {
    const auto& moves = pawn_moves();
    REQUIRE(moves[0] == Offset{0, 3});
    REQUIRE(moves[1] == Offset{-2, 2});
    REQUIRE(moves[2] == Offset{-3, 0});
    REQUIRE(moves[3] == Offset{-2, -2});
    REQUIRE(moves[4] == Offset{0, -3});
    REQUIRE(moves[5] == Offset{2, -2});
    REQUIRE(moves[6] == Offset{3, 0});
    REQUIRE(moves[7] == Offset{2, 2});
}

TEST_CASE("pawn_moves returns the shared catalog", "[moves]") {
    REQUIRE(&pawn_moves() == &pawn_moves());
}

TEST_CASE("Cell plus Offset", "[moves]") {
    Cell c{4, 5};
    REQUIRE(c + Offset{-2, 2} == Cell{2, 7});
    REQUIRE(c + Offset{0, -3} == Cell{4, 2});
    REQUIRE(c != Cell{5, 4});
}

// ============================================================================
// Board tests
// ============================================================================

TEST_CASE("Board initial state", "[board]") {
    Board b(4);

    REQUIRE(b.dimension() == 4);
    REQUIRE(b.cell_count() == 16);
    REQUIRE(b.visited_count() == 0);
    REQUIRE(b.unvisited_value() == 0);
    for (int r = 0; r < 4; ++r) {
        for (int c = 0; c < 4; ++c) {
            REQUIRE(b.at(Cell{r, c}) == 0);
            REQUIRE(b.is_unvisited(Cell{r, c}));
        }
    }
}

TEST_CASE("Board rejects invalid construction", "[board]") {
    REQUIRE_THROWS_AS(Board(0), std::invalid_argument);
    REQUIRE_THROWS_AS(Board(-3), std::invalid_argument);
    // 正の未訪問値はステップ番号と衝突する
    REQUIRE_THROWS_AS(Board(5, 1), std::invalid_argument);
    REQUIRE_NOTHROW(Board(5, -1));
}

TEST_CASE("Board contains and is_legal", "[board]") {
    Board b(3);

    SECTION("inside cells") {
        REQUIRE(b.contains(Cell{0, 0}));
        REQUIRE(b.contains(Cell{2, 2}));
        REQUIRE(b.is_legal(Cell{1, 2}));
    }

    SECTION("outside cells are never legal") {
        REQUIRE(!b.contains(Cell{-1, 0}));
        REQUIRE(!b.contains(Cell{0, 3}));
        REQUIRE(!b.contains(Cell{3, 3}));
        REQUIRE(!b.is_legal(Cell{-2, -2}));
        REQUIRE(!b.is_legal(Cell{0, 5}));
    }

    SECTION("visited cells are not legal") {
        b.mark(Cell{1, 1}, 1);
        REQUIRE(!b.is_legal(Cell{1, 1}));
        REQUIRE(!b.is_unvisited(Cell{1, 1}));
        REQUIRE(b.is_legal(Cell{1, 0}));
    }
}

TEST_CASE("Board mark", "[board]") {
    Board b(3);

    SECTION("stores step number") {
        b.mark(Cell{0, 2}, 1);
        b.mark(Cell{2, 0}, 2);
        REQUIRE(b.at(Cell{0, 2}) == 1);
        REQUIRE(b.at(Cell{2, 0}) == 2);
        REQUIRE(b.visited_count() == 2);
    }

    SECTION("double mark fails") {
        b.mark(Cell{0, 0}, 1);
        REQUIRE_THROWS_AS(b.mark(Cell{0, 0}, 2), std::logic_error);
        REQUIRE(b.at(Cell{0, 0}) == 1);
        REQUIRE(b.visited_count() == 1);
    }

    SECTION("out of board") {
        REQUIRE_THROWS_AS(b.mark(Cell{3, 0}, 1), std::out_of_range);
        REQUIRE_THROWS_AS(b.at(Cell{0, -1}), std::out_of_range);
    }

    SECTION("non-positive step") {
        REQUIRE_THROWS_AS(b.mark(Cell{0, 0}, 0), std::invalid_argument);
        REQUIRE(b.is_unvisited(Cell{0, 0}));
    }
}

TEST_CASE("Board with custom unvisited value", "[board]") {
    Board b(2, -1);
    REQUIRE(b.at(Cell{1, 1}) == -1);
    REQUIRE(b.is_legal(Cell{1, 1}));

    b.mark(Cell{1, 1}, 1);
    REQUIRE(!b.is_legal(Cell{1, 1}));
}

// ============================================================================
// Render tests
// ============================================================================

TEST_CASE("format_board pads markers to width 3", "[render]") {
    Board b(2);
    b.mark(Cell{0, 0}, 1);
    b.mark(Cell{1, 1}, 12);

    REQUIRE(format_board(b) == "  1  0\n  0 12\n");
}

TEST_CASE("format_cell", "[render]") {
    REQUIRE(format_cell(Cell{3, 7}) == "[row:3, column:7]");
}
