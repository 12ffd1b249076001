#include "minichess/attack.hpp"
#include "minichess/movegen.hpp"
#include "minichess/types.hpp"

namespace minichess {

BB attacked_pieces(const Board& b, Color by) {
  MoveList ml;
  generate_moves(b, by, ml);
  const BB theirs = b.occupancy(other(by));
  BB hit = 0U;
  for (const auto& m : ml) {
    if ((theirs >> m.to) & 1U) hit |= (1U << m.to);
  }
  return hit;
}

} // namespace minichess
