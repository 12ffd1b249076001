#pragma once
#include <stdexcept>
#include "minichess/move.hpp"
#include "minichess/board.hpp"

namespace minichess {

// Raised when a move does not fit the board it is applied to. This is a
// programming error (bad generator output or a stale move), never a game
// condition.
struct InvariantError : std::logic_error { using std::logic_error::logic_error; };

// Minimal reversible state for undo
struct State {
  Color   us{Color::White};        // side who moved
  int     prev_halfmove{0};
  int     prev_fullmove{1};
  Piece   moved{Piece::None};      // piece that moved (pre-promo)
};

void do_move(Board& b, const Move& m, State& st);
void undo_move(Board& b, const Move& m, const State& st);

} // namespace minichess
