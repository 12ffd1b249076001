#include <cassert>
#include "minichess/board.hpp"
#include "minichess/fen.hpp"
#include "minichess/movegen.hpp"
#include "minichess/perft.hpp"

int main() {
  using namespace minichess;
  // Bishop c3: d4 e5 | b4 a5(capture) | d2 (e1 own) | b2 a1 = 7, king e1 = 3
  Board b;
  set_from_fen(b, "k4/5/2B2/5/4K w 0 1");
  assert(perft(b, 1) == 10ULL);

  // Rays stop on b4 (capture) and before d2 (own pawn):
  // bishop d4 e5 b4 b2 a1 = 5, king d1 e2 = 2, pawn d3 = 1
  set_from_fen(b, "k4/1p3/2B2/3P1/4K w 0 1");
  assert(perft(b, 1) == 8ULL);

  MoveList ml;
  generate_pseudo_legal(b, ml);
  int captures = 0;
  for (const auto& m : ml)
    if (m.from == make_square(2, 2) && has_flag(m.flags, MoveFlag::Capture)) {
      assert(m.to == make_square(1, 3) && m.captured == Piece::Pawn);
      ++captures;
    }
  assert(captures == 1);
  return 0;
}
