/**
 * @file board.hpp
 * @brief 盤面クラス（訪問マーカーの正方グリッド）
 */
#ifndef PAWN_TOUR_BOARD_HPP
#define PAWN_TOUR_BOARD_HPP

#include "pawn_tour/types.hpp"
#include <vector>
#include <cstddef>

namespace pawn_tour {

/**
 * @brief dimension x dimension の盤面
 *
 * 各マスは未訪問マーカー（既定値 0）か、訪問したステップ番号（1 以上）を持つ。
 * 1 回の試行で 1 つの Board を排他的に所有し、マスを未訪問に戻すことはない。
 * マーカーは行優先のフラット vector で保持する。
 */
class Board {
public:
    using value_type = int;

    /**
     * @brief 全マス未訪問の盤面を作成
     * @param dimension 一辺のマス数（1 以上）
     * @param unvisited_value 未訪問を表す値（ステップ番号と衝突しないよう 0 以下）
     * @throws std::invalid_argument dimension <= 0 または unvisited_value > 0
     */
    explicit Board(int dimension, value_type unvisited_value = 0);

    int dimension() const { return dimension_; }

    value_type unvisited_value() const { return unvisited_; }

    /**
     * @brief マスの総数（dimension²）
     */
    size_t cell_count() const { return markers_.size(); }

    /**
     * @brief 訪問済みマスの数
     */
    size_t visited_count() const { return visited_; }

    /**
     * @brief 盤面内のマスか
     */
    bool contains(const Cell& cell) const {
        return cell.row >= 0 && cell.col >= 0 &&
               cell.row < dimension_ && cell.col < dimension_;
    }

    /**
     * @brief マーカーを取得
     * @throws std::out_of_range 盤面外
     */
    value_type at(const Cell& cell) const;

    /**
     * @brief 未訪問か
     * @throws std::out_of_range 盤面外
     */
    bool is_unvisited(const Cell& cell) const { return at(cell) == unvisited_; }

    /**
     * @brief 移動先として有効か（盤面内かつ未訪問）
     *
     * 盤面外は範囲外アクセスせずに false を返す。
     */
    bool is_legal(const Cell& cell) const {
        return contains(cell) && markers_[index(cell)] == unvisited_;
    }

    /**
     * @brief マスを訪問済みにする
     * @param step 訪問したステップ番号（1 以上）
     * @throws std::out_of_range 盤面外
     * @throws std::logic_error 既に訪問済み
     * @throws std::invalid_argument step <= 0
     */
    void mark(const Cell& cell, value_type step);

private:
    size_t index(const Cell& cell) const {
        return static_cast<size_t>(cell.row) * static_cast<size_t>(dimension_) +
               static_cast<size_t>(cell.col);
    }

    int dimension_;
    value_type unvisited_;
    size_t visited_ = 0;
    std::vector<value_type> markers_;
};

} // namespace pawn_tour

#endif // PAWN_TOUR_BOARD_HPP
