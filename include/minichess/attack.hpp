#pragma once
#include "minichess/board.hpp"

namespace minichess {

// Squares holding a piece of the opponent of `by` that `by` could capture
// with one move.
BB attacked_pieces(const Board& b, Color by);

} // namespace minichess
