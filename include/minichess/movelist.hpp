#pragma once
#include <array>
#include <cstddef>
#include "minichess/move.hpp"


namespace minichess {


// The initial six pieces reach at most 46 moves on a 5x5 board; promoted
// queens add at most 16 each.
struct MoveList {
static constexpr std::size_t CAP = 160;
std::array<Move, CAP> data{};
std::size_t sz = 0;


void push(const Move& m) { if (sz < CAP) data[sz++] = m; }
void clear() { sz = 0; }
const Move* begin() const { return data.data(); }
const Move* end() const { return data.data() + sz; }
const Move& operator[](std::size_t i) const { return data[i]; }
std::size_t size() const { return sz; }
bool empty() const { return sz == 0; }
};


} // namespace minichess
