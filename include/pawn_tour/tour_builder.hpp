/**
 * @file tour_builder.hpp
 * @brief ツアー構築クラス（Warnsdorff ヒューリスティック）
 */
#ifndef PAWN_TOUR_TOUR_BUILDER_HPP
#define PAWN_TOUR_TOUR_BUILDER_HPP

#include "pawn_tour/board.hpp"
#include "pawn_tour/moves.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace pawn_tour {

/**
 * @brief 1 回の試行の結果
 *
 * path[i] はステップ番号 i + 1 で訪問したマス。
 * success が true なら path は盤面の全マスを 1 回ずつ含む。
 */
struct TourResult {
    std::vector<Cell> path;
    bool success = false;
};

/**
 * @brief 直近の試行の統計情報
 */
struct TourStats {
    size_t steps = 0;
    size_t degree_evaluations = 0;
    size_t candidate_checks = 0;
};

/**
 * @brief ステップごとのコールバック関数型
 * @return trueを返すと構築を継続、falseで停止
 */
using StepCallback = std::function<bool(const Board&, const Cell&, int step)>;

/**
 * @brief Warnsdorff ヒューリスティックによるツアー構築
 *
 * 各ステップで有効な移動先のうち degree（そこから先の有効な移動先の数）が
 * 最小のものを選ぶ。同じ degree の場合は移動パターンの列挙順で先のものを選ぶ。
 * バックトラックはせず、移動先がなくなった時点で試行を終了する。
 * 内部に乱数を持たないため、同じ入力には常に同じ結果を返す。
 */
class TourBuilder {
public:
    /**
     * @param moves 移動パターン（コピーを保持する）
     */
    explicit TourBuilder(std::vector<Offset> moves = pawn_moves());

    /**
     * @brief 新しい盤面でツアーを構築
     * @param dimension 一辺のマス数
     * @param start 開始位置
     * @throws std::invalid_argument dimension <= 0 または start が盤面外
     * @note 全マスを覆えなかった場合も例外にはせず success = false を返す
     */
    TourResult build(int dimension, const Cell& start);

    /**
     * @brief 呼び出し側が用意した未使用の盤面でツアーを構築
     * @throws std::invalid_argument 盤面が訪問済みマスを含む、または start が盤面外
     */
    TourResult run(Board& board, const Cell& start);

    /**
     * @brief 次の移動先を選択
     * @return degree 最小の有効な移動先。なければstd::nullopt
     */
    std::optional<Cell> select_next(const Board& board, const Cell& current);

    /**
     * @brief cell から移動可能な有効マスの数
     *
     * cell 自体は訪問済みにせず、現在の盤面のまま数える。
     */
    int degree(const Board& board, const Cell& cell);

    const std::vector<Offset>& moves() const { return moves_; }

    /**
     * @brief 統計情報を取得
     */
    const TourStats& stats() const { return stats_; }

    /**
     * @brief ステップごとのコールバックを設定
     */
    void set_step_callback(StepCallback callback) { step_callback_ = std::move(callback); }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    bool is_legal(const Board& board, const Cell& cell);

    std::vector<Offset> moves_;
    StepCallback step_callback_;
    bool verbose_ = false;
    TourStats stats_;
};

} // namespace pawn_tour

#endif // PAWN_TOUR_TOUR_BUILDER_HPP
