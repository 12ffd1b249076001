#include <cassert>
#include <string>
#include "minichess/board.hpp"
#include "minichess/fen.hpp"
#include "minichess/movegen.hpp"
#include "minichess/move_do.hpp"

using namespace minichess;

// Every move two plies deep must restore the position exactly.
static void check_restores(Board& b, int depth) {
  if (depth == 0) return;
  const auto h0  = b.hash();
  const std::string f0 = to_fen(b);

  MoveList ml; generate_pseudo_legal(b, ml);
  for (const auto& m : ml) {
    State st{};
    do_move(b, m, st);
    assert(b.side_to_move() != st.us);
    if (m.captured != Piece::None) assert(b.halfmove_clock() == 0);
    else assert(b.halfmove_clock() == st.prev_halfmove + 1);
    check_restores(b, depth - 1);
    undo_move(b, m, st);
    assert(b.hash() == h0);
    assert(to_fen(b) == f0);
  }
}

int main() {
  Board b;
  set_from_fen(b, STARTPOS_FEN);
  check_restores(b, 3);

  Board mid;
  set_from_fen(mid, "k1b2/1pQ2/2p2/1P1n1/2B1K b 5 9");
  check_restores(mid, 2);

  // Fullmove number advances after Black's move only
  Board c;
  set_from_fen(c, STARTPOS_FEN);
  MoveList ml; generate_pseudo_legal(c, ml);
  State st{};
  do_move(c, ml[0], st);
  assert(c.fullmove_number() == 1);
  MoveList ml2; generate_pseudo_legal(c, ml2);
  State st2{};
  do_move(c, ml2[0], st2);
  assert(c.fullmove_number() == 2);
  return 0;
}
