#include "pawn_tour/driver.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace pawn_tour {

Cell RandomStartSource::operator()(int dimension) {
    std::uniform_int_distribution<int> dist(0, dimension - 1);
    int row = dist(rng_);
    int col = dist(rng_);
    return Cell{row, col};
}

TourDriver::TourDriver(DriverConfig config, StartSource start_source)
    : config_(config), start_source_(std::move(start_source)) {
    if (config_.dimension <= 0) {
        throw std::invalid_argument("Board dimension must be positive: " +
                                    std::to_string(config_.dimension));
    }
    if (config_.max_attempts <= 0) {
        throw std::invalid_argument("Max attempts must be positive: " +
                                    std::to_string(config_.max_attempts));
    }
    if (!start_source_) {
        throw std::invalid_argument("Start source is empty");
    }
}

DriverResult TourDriver::run() {
    DriverResult result;
    auto start_time = std::chrono::steady_clock::now();

    if (verbose_) {
        std::cerr << "% [verbose] driver start: dimension=" << config_.dimension
                  << " max_attempts=" << config_.max_attempts << "\n";
    }

    while (!result.found && result.attempts < config_.max_attempts && !stopped_) {
        // 試行ごとに盤面を作り直す
        Board board(config_.dimension, config_.unvisited_value);
        Cell start = start_source_(config_.dimension);
        if (!board.contains(start)) {
            throw std::invalid_argument("Start source returned cell out of board: (" +
                                        std::to_string(start.row) + ", " +
                                        std::to_string(start.col) + ")");
        }

        int attempt = result.attempts++;
        if (attempt_callback_) {
            attempt_callback_(attempt, start, nullptr);
        }

        result.tour = builder_.run(board, start);
        result.found = result.tour.success;

        if (attempt_callback_) {
            attempt_callback_(attempt, start, &result.tour);
        }
    }

    if (verbose_ && stopped_ && !result.found) {
        std::cerr << "% [verbose] driver stopped after " << result.attempts
                  << " attempts\n";
    }

    auto elapsed = std::chrono::steady_clock::now() - start_time;
    result.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
    return result;
}

} // namespace pawn_tour
