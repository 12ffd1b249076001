#include <cassert>
#include <iostream>

#include "minichess/board.hpp"
#include "minichess/fen.hpp"
#include "minichess/search.hpp"

using namespace minichess;

// Pruning may only change how many nodes are visited, never the answer.
int main() {
  static const char* FENS[] = {
    STARTPOS_FEN,
    "kqbn1/2pp1/5/1PP2/1NBQK b 0 1",
    "k1b2/1pQ2/2p2/1P1n1/2B1K b 5 9",
    "1k3/p1q2/1N3/3B1/P3K w 2 4",
    "2k2/5/q1Q2/5/K4 w 0 1",
    "k4/1p3/2N2/3p1/Q3K w 17 30",
  };
  static const Heuristic HS[] = { Heuristic::Material, Heuristic::Positional, Heuristic::Safety };

  for (const char* fen : FENS) {
    Board b;
    set_from_fen(b, fen);
    for (Heuristic h : HS) {
      for (int d = 1; d <= 4; ++d) {
        const SearchResult mm = search_fixed_depth(b, d, false, h);
        const SearchResult ab = search_fixed_depth(b, d, true, h);
        assert(mm.status == SearchStatus::Ok && ab.status == SearchStatus::Ok);
        assert(same_move(mm.best, ab.best));
        assert(mm.score == ab.score);
        assert(ab.nodes <= mm.nodes);
      }
    }
  }

  // On the opening tree pruning actually cuts something.
  {
    Board b;
    set_from_fen(b, STARTPOS_FEN);
    const SearchResult mm = search_fixed_depth(b, 4, false, Heuristic::Material);
    const SearchResult ab = search_fixed_depth(b, 4, true, Heuristic::Material);
    assert(ab.nodes < mm.nodes);
  }

  std::cout << "search_equivalence_smoke ok\n";
  return 0;
}
