#include <cassert>
#include "minichess/fen.hpp"
#include "minichess/eval.hpp"
#include "minichess/board.hpp"

using namespace minichess;

static int eval_fen(const char* fen, Heuristic h) {
  Board b;
  set_from_fen(b, fen);
  return evaluate(b, h);
}

int main() {
  // The initial layout is symmetric, so every heuristic calls it level.
  assert(eval_fen(STARTPOS_FEN, Heuristic::Material) == 0);
  assert(eval_fen(STARTPOS_FEN, Heuristic::Positional) == 0);
  assert(eval_fen(STARTPOS_FEN, Heuristic::Safety) == 0);

  // e0: White up a queen (kings cancel)
  assert(eval_fen("k4/5/2Q2/5/4K w 0 1", Heuristic::Material) == 900);
  // e0: Black up a knight
  assert(eval_fen("kn3/5/5/5/4K w 0 1", Heuristic::Material) == -300);
  // e0: White up a pawn
  assert(eval_fen("k4/5/5/1P3/4K w 0 1", Heuristic::Material) == 100);

  // Side to move does not change evaluate(), only evaluate_stm()
  {
    Board w, b;
    set_from_fen(w, "k4/5/2Q2/5/4K w 0 1");
    set_from_fen(b, "k4/5/2Q2/5/4K b 0 1");
    assert(evaluate(w, Heuristic::Positional) == evaluate(b, Heuristic::Positional));
    assert(evaluate_stm(w, Heuristic::Positional) == -evaluate_stm(b, Heuristic::Positional));
    assert(evaluate_stm(w, Heuristic::Material) == 900);
  }

  // e1: a centralised knight beats a cornered one; e0 cannot tell them apart
  {
    const char* centre = "k4/5/2N2/5/4K w 0 1";
    const char* corner = "k4/5/5/5/N3K w 0 1";
    assert(eval_fen(centre, Heuristic::Material) == eval_fen(corner, Heuristic::Material));
    assert(eval_fen(centre, Heuristic::Positional) > eval_fen(corner, Heuristic::Positional));
  }

  // e1: an advanced pawn is worth more than one at home
  assert(eval_fen("k4/1P3/5/5/4K w 0 1", Heuristic::Positional) >
         eval_fen("k4/5/5/1P3/4K w 0 1", Heuristic::Positional));

  // e2: White's queen on c1 hangs to the b2 pawn (900/8 + 900/16 = 168) while
  // the queen only threatens that pawn (100/8 + 100/16 = 18).
  {
    const char* fen = "k4/5/5/1p3/2Q1K w 0 1";
    assert(eval_fen(fen, Heuristic::Safety) - eval_fen(fen, Heuristic::Positional) == 18 - 168);
  }

  // Heuristic ids
  assert(parse_heuristic("e0") == Heuristic::Material);
  assert(parse_heuristic("e1") == Heuristic::Positional);
  assert(parse_heuristic("E2") == Heuristic::Safety);
  assert(parse_heuristic("safety") == Heuristic::Safety);
  assert(heuristic_name(Heuristic::Positional) == "e1");
  bool threw = false;
  try { (void)parse_heuristic("e3"); } catch (const ConfigError&) { threw = true; }
  assert(threw);

  return 0;
}
