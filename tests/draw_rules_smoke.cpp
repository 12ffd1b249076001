#include <cassert>
#include <iostream>

#include "minichess/board.hpp"
#include "minichess/draw.hpp"
#include "minichess/fen.hpp"
#include "minichess/game.hpp"
#include "minichess/search.hpp"

using namespace minichess;

static Move mv(int ff, int fr, int tf, int tr) {
  return Move{ make_square(ff, fr), make_square(tf, tr), MoveFlag::Quiet, Piece::None, Piece::None };
}

int main() {
  // 1) Twenty half-moves without a capture draw the game; a 21st is refused.
  {
    Game g;
    const Move cycle[4] = {
      mv(1, 0, 0, 2),  // Nb1-a3
      mv(3, 4, 4, 2),  // Nd5-e3
      mv(0, 2, 1, 0),  // Na3-b1
      mv(4, 2, 3, 4),  // Ne3-d5
    };
    for (int ply = 0; ply < NO_CAPTURE_DRAW_PLIES; ++ply) {
      assert(!g.over());
      g.apply(cycle[ply % 4]);
      assert(g.board().halfmove_clock() == ply + 1);
    }
    assert(g.over());
    assert(g.outcome() == GameOutcome::Draw);
    assert(g.moves().size() == static_cast<std::size_t>(NO_CAPTURE_DRAW_PLIES));

    bool threw = false;
    try { g.apply(cycle[0]); } catch (const GameError&) { threw = true; }
    assert(threw);
    assert(g.moves().size() == static_cast<std::size_t>(NO_CAPTURE_DRAW_PLIES));
  }

  // 2) A capture resets the clock.
  {
    Game g;
    g.apply(mv(1, 0, 0, 2));  // Nb1-a3
    g.apply(mv(3, 4, 4, 2));  // Nd5-e3
    assert(g.board().halfmove_clock() == 2);
    g.apply(mv(3, 0, 3, 3));  // Qd1xd4
    assert(g.moves().back().captured == Piece::Pawn);
    assert(g.board().halfmove_clock() == 0);
    assert(!g.over());
  }

  // 3) The predicate itself
  {
    Board b;
    set_from_fen(b, "k4/5/2Q2/5/4K w 19 10");
    assert(!is_no_capture_draw(b));
    set_from_fen(b, "k4/5/2Q2/5/4K w 20 11");
    assert(is_no_capture_draw(b));
  }

  // 4) Search sees the draw coming: a queen up, but every move is quiet and
  // ends the game drawn.
  {
    Board b;
    set_from_fen(b, "3k1/5/5/5/Q3K w 19 10");
    assert(search_fixed_depth(b, 1, false, Heuristic::Material).score == 0);
    assert(search_fixed_depth(b, 2, true, Heuristic::Positional).score == 0);
  }

  std::cout << "draw_rules_smoke ok\n";
  return 0;
}
