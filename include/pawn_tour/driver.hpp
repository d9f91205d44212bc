/**
 * @file driver.hpp
 * @brief 試行ドライバ（開始位置を変えながらツアー構築を繰り返す）
 */
#ifndef PAWN_TOUR_DRIVER_HPP
#define PAWN_TOUR_DRIVER_HPP

#include "pawn_tour/tour_builder.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <random>

namespace pawn_tour {

/**
 * @brief ドライバ設定
 */
struct DriverConfig {
    int dimension = 10;
    int max_attempts = 100;
    Board::value_type unvisited_value = 0;
};

/**
 * @brief 開始位置の生成関数型
 * @param dimension 盤面の一辺のマス数
 * @return [0, dimension) x [0, dimension) 内のマス
 */
using StartSource = std::function<Cell(int dimension)>;

/**
 * @brief 一様乱数による開始位置の生成
 */
class RandomStartSource {
public:
    explicit RandomStartSource(uint32_t seed) : rng_(seed) {}

    Cell operator()(int dimension);

private:
    std::mt19937 rng_;
};

/**
 * @brief 試行の前後に呼ばれるコールバック
 *
 * result は試行前の呼び出しでは nullptr。
 */
using AttemptCallback = std::function<void(int attempt, const Cell& start,
                                           const TourResult* result)>;

/**
 * @brief ドライバの実行結果
 */
struct DriverResult {
    bool found = false;
    int attempts = 0;
    TourResult tour;  // 最後の試行の結果
    int64_t elapsed_ms = 0;
};

/**
 * @brief ツアーが見つかるか試行回数の上限に達するまで構築を繰り返す
 *
 * 試行ごとに新しい Board を確保し、開始位置は StartSource から取得する。
 * TourBuilder 自体は決定的で、乱数はすべて StartSource 側にある。
 */
class TourDriver {
public:
    /**
     * @throws std::invalid_argument dimension <= 0 または max_attempts <= 0
     */
    TourDriver(DriverConfig config, StartSource start_source);

    /**
     * @brief 試行を繰り返す
     * @throws std::invalid_argument StartSource が盤面外のマスを返した
     */
    DriverResult run();

    const DriverConfig& config() const { return config_; }

    /**
     * @brief 最後の試行の TourBuilder 統計
     */
    const TourStats& last_stats() const { return builder_.stats(); }

    void set_attempt_callback(AttemptCallback callback) { attempt_callback_ = std::move(callback); }

    void set_step_callback(StepCallback callback) { builder_.set_step_callback(std::move(callback)); }

    void set_verbose(bool enabled) {
        verbose_ = enabled;
        builder_.set_verbose(enabled);
    }

    /**
     * @brief 試行を停止する（シグナルハンドラから呼び出し可能）
     *
     * 実行中の試行は最後まで続き、次の試行から打ち切る。
     */
    void stop() { stopped_ = true; }

    void reset_stop() { stopped_ = false; }

    bool is_stopped() const { return stopped_; }

private:
    std::atomic<bool> stopped_{false};
    bool verbose_ = false;
    DriverConfig config_;
    StartSource start_source_;
    AttemptCallback attempt_callback_;
    TourBuilder builder_;
};

} // namespace pawn_tour

#endif // PAWN_TOUR_DRIVER_HPP
