#include "pawn_tour/tour_builder.hpp"
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace pawn_tour {

TourBuilder::TourBuilder(std::vector<Offset> moves)
    : moves_(std::move(moves)) {}

TourResult TourBuilder::build(int dimension, const Cell& start) {
    if (dimension <= 0) {
        throw std::invalid_argument("Board dimension must be positive: " +
                                    std::to_string(dimension));
    }
    Board board(dimension);
    return run(board, start);
}

TourResult TourBuilder::run(Board& board, const Cell& start) {
    if (!board.contains(start)) {
        throw std::invalid_argument("Start cell out of board: (" +
                                    std::to_string(start.row) + ", " +
                                    std::to_string(start.col) + ")");
    }
    if (board.visited_count() != 0) {
        throw std::invalid_argument("Board already has visited cells");
    }

    stats_ = TourStats{};
    TourResult result;
    result.path.reserve(board.cell_count());

    if (verbose_) {
        std::cerr << "% [verbose] attempt start: dimension=" << board.dimension()
                  << " start=" << start << "\n";
    }

    // 開始位置をステップ 1 として訪問
    int step = 1;
    Cell current = start;
    board.mark(current, step);
    result.path.push_back(current);
    stats_.steps = 1;

    bool stopped = step_callback_ && !step_callback_(board, current, step);

    // 1 ステップで 1 マスずつ埋まるので高々 dimension² 回で終了する
    while (!stopped && result.path.size() < board.cell_count()) {
        auto next = select_next(board, current);
        if (!next) {
            break;  // 移動先なし
        }
        ++step;
        current = *next;
        board.mark(current, step);
        result.path.push_back(current);
        stats_.steps++;

        if (step_callback_ && !step_callback_(board, current, step)) {
            stopped = true;
        }
    }

    result.success = (result.path.size() == board.cell_count());

    if (verbose_) {
        std::cerr << "% [verbose] attempt done: steps=" << stats_.steps
                  << "/" << board.cell_count()
                  << " success=" << (result.success ? "true" : "false")
                  << " degree_evals=" << stats_.degree_evaluations
                  << (stopped ? " (stopped)" : "") << "\n";
    }
    return result;
}

std::optional<Cell> TourBuilder::select_next(const Board& board, const Cell& current) {
    int min_degree = std::numeric_limits<int>::max();
    std::optional<Cell> chosen;

    for (const auto& move : moves_) {
        Cell candidate = current + move;
        if (!is_legal(board, candidate)) {
            continue;
        }
        int d = degree(board, candidate);
        // 厳密に小さい場合のみ更新（同点は列挙順で先のものを残す）
        if (d < min_degree) {
            min_degree = d;
            chosen = candidate;
        }
    }
    return chosen;
}

int TourBuilder::degree(const Board& board, const Cell& cell) {
    stats_.degree_evaluations++;
    int count = 0;
    for (const auto& move : moves_) {
        if (is_legal(board, cell + move)) {
            count++;
        }
    }
    return count;
}

bool TourBuilder::is_legal(const Board& board, const Cell& cell) {
    stats_.candidate_checks++;
    return board.is_legal(cell);
}

} // namespace pawn_tour
