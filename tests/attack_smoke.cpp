#include <cassert>
#include <iostream>

#include "minichess/attack.hpp"
#include "minichess/board.hpp"
#include "minichess/fen.hpp"

using namespace minichess;

static BB bit(int file, int rank) { return 1U << make_square(file, rank); }

int main() {
  Board b;

  // Start position: nothing is in reach for either side.
  set_from_fen(b, STARTPOS_FEN);
  assert(attacked_pieces(b, Color::White) == 0U);
  assert(attacked_pieces(b, Color::Black) == 0U);

  // Bishop c3 hits the pawn on b4; the black pawn hits the bishop back.
  // Empty squares the pieces reach are not reported.
  set_from_fen(b, "k4/1p3/2B2/3P1/4K w 0 1");
  assert(attacked_pieces(b, Color::White) == bit(1, 3));
  assert(attacked_pieces(b, Color::Black) == bit(2, 2));

  // Works for the side not on move as well.
  set_from_fen(b, "k4/1p3/2B2/3P1/4K b 0 1");
  assert(attacked_pieces(b, Color::White) == bit(1, 3));

  // Kings are capturable targets.
  set_from_fen(b, "k4/5/2Q2/5/4K w 0 1");
  assert(attacked_pieces(b, Color::White) == bit(0, 4));
  assert(attacked_pieces(b, Color::Black) == 0U);

  // Own pieces are never targets.
  set_from_fen(b, "k4/5/5/PP3/KP3 w 0 1");
  assert(attacked_pieces(b, Color::White) == 0U);

  std::cout << "attack_smoke ok\n";
  return 0;
}
