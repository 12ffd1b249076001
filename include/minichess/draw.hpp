#pragma once

#include "minichess/board.hpp"
#include "minichess/types.hpp"

namespace minichess {

// Ten full turns without a capture end the game in a draw.
inline constexpr int NO_CAPTURE_DRAW_PLIES = 20;

inline bool is_no_capture_draw(const Board& b) {
  return b.halfmove_clock() >= NO_CAPTURE_DRAW_PLIES;
}

// The game is won by capturing the enemy king.
inline bool king_captured(const Board& b) {
  return !b.has_king(Color::White) || !b.has_king(Color::Black);
}

} // namespace minichess
