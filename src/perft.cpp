#include "minichess/perft.hpp"
#include "minichess/draw.hpp"
#include "minichess/movegen.hpp"
#include "minichess/move_do.hpp"
#include <vector>

namespace minichess {

// A position without one of the kings is finished and has no children.
static std::uint64_t perft_mut(Board& b, int depth) {
  if (depth == 0) return 1ULL;
  if (king_captured(b)) return 0ULL;

  MoveList ml;
  generate_pseudo_legal(b, ml);

  std::uint64_t nodes = 0ULL;
  for (const auto& m : ml) {
    State st{};
    do_move(b, m, st);
    nodes += perft_mut(b, depth - 1);
    undo_move(b, m, st);
  }
  return nodes;
}

std::uint64_t perft(const Board& b, int depth) {
  Board copy = b;              // copy once at root
  return perft_mut(copy, depth);
}

void perft_divide(const Board& b, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out) {
  out.clear();
  if (depth <= 0 || king_captured(b)) return;

  Board root = b;
  MoveList ml;
  generate_pseudo_legal(root, ml);

  for (const auto& m : ml) {
    State st{};
    do_move(root, m, st);
    out.emplace_back(m, perft_mut(root, depth - 1));
    undo_move(root, m, st);
  }
}

} // namespace minichess
