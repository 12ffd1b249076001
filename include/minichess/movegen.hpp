#pragma once
#include "minichess/board.hpp"
#include "minichess/movelist.hpp"


namespace minichess {


// All moves for `side`, in a fixed order: squares ascending, and per piece a
// fixed direction order. Kings may be captured and check is not enforced, so
// every generated move is legal.
void generate_moves(const Board& b, Color side, MoveList& out);

// Same, for the side to move.
void generate_pseudo_legal(const Board& b, MoveList& out);


} // namespace minichess
