#include "minichess/move_do.hpp"

#include <string>

namespace minichess {

void do_move(Board& b, const Move& m, State& st) {
  st.us            = b.side_to_move();
  st.prev_halfmove = b.halfmove_clock();
  st.prev_fullmove = b.fullmove_number();

  Color sc; Piece srcP = b.piece_at(m.from, &sc);
  if (srcP == Piece::None)
    throw InvariantError("move " + move_to_string(m) + " starts on an empty square");
  if (sc != st.us)
    throw InvariantError("move " + move_to_string(m) + " moves a piece of the side not to move");
  st.moved = srcP;

  // destination occupancy must match what the generator recorded
  Color dc; Piece dstP = b.piece_at(m.to, &dc);
  if (dstP != Piece::None && dc == st.us)
    throw InvariantError("move " + move_to_string(m) + " lands on a friendly piece");
  if (dstP != m.captured)
    throw InvariantError("move " + move_to_string(m) + " does not match the captured piece on the board");

  if (dstP != Piece::None) b.remove_piece(dc, dstP, m.to);

  // move (with promotion if any)
  b.remove_piece(st.us, srcP, m.from);
  b.set_piece(st.us, (m.promo != Piece::None ? m.promo : srcP), m.to);

  // only captures reset the clock in this ruleset
  if (dstP != Piece::None) b.set_halfmove_clock(0);
  else b.set_halfmove_clock(st.prev_halfmove + 1);

  // fullmove after Black
  if (st.us == Color::Black) b.set_fullmove_number(st.prev_fullmove + 1);

  // swap side
  b.set_side_to_move(other(st.us));
}

void undo_move(Board& b, const Move& m, const State& st) {
  // restore side
  b.set_side_to_move(st.us);

  // restore counters
  b.set_halfmove_clock(st.prev_halfmove);
  b.set_fullmove_number(st.prev_fullmove);

  Color mc; Piece movedNow = b.piece_at(m.to, &mc);
  if (movedNow == Piece::None || mc != st.us)
    throw InvariantError("undo of " + move_to_string(m) + " finds no piece of the mover on the target");
  b.remove_piece(st.us, movedNow, m.to);
  b.set_piece(st.us, st.moved, m.from);

  if (m.captured != Piece::None) {
    b.set_piece(other(st.us), m.captured, m.to);
  }
}

} // namespace minichess
