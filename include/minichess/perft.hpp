#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "minichess/types.hpp"
#include "minichess/board.hpp"
#include "minichess/movegen.hpp"

namespace minichess {

std::uint64_t perft(const Board& b, int depth);

// Per-move breakdown at root
void perft_divide(const Board& b, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out);

} // namespace minichess
