#include "minichess/zobrist.hpp"


namespace minichess {


const Zobrist& Zobrist::instance() {
static const Zobrist z = [] { Zobrist t; t.init(); return t; }();
return z;
}


void Zobrist::init(std::uint64_t seed) {
// Deterministic but non-trivial distribution
std::uint64_t x = seed;
auto next = [&]() -> std::uint64_t { return splitmix64(x); };


for (int c = 0; c < COLOR_N; ++c)
for (int p = 0; p < PIECE_N; ++p)
for (int s = 0; s < SQUARE_N; ++s)
piece_on[static_cast<std::size_t>(c)]
[static_cast<std::size_t>(p)]
[static_cast<std::size_t>(s)] = next();


side_to_move = next();
}


} // namespace minichess
