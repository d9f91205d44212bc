/**
 * @file options.hpp
 * @brief コマンドライン数値オプションの解釈
 */
#ifndef PAWN_TOUR_OPTIONS_HPP
#define PAWN_TOUR_OPTIONS_HPP

#include <cstdint>

namespace pawn_tour {

/**
 * @brief 正の整数オプションを解釈
 * @param option エラーメッセージ用のオプション名（"-n" など）
 * @throws std::invalid_argument 数値でない、末尾に余分な文字がある、範囲 [1, 1000000] 外
 */
int parse_positive(const char* option, const char* value);

/**
 * @brief 乱数シードを解釈（32bit 符号なし整数のみ）
 * @throws std::invalid_argument 数値でない、負号付き、32bit を超える
 */
uint32_t parse_seed(const char* value);

} // namespace pawn_tour

#endif // PAWN_TOUR_OPTIONS_HPP
