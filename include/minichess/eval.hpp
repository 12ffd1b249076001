#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include "minichess/board.hpp"

namespace minichess {

struct ConfigError : std::runtime_error { using std::runtime_error::runtime_error; };

// e0, e1, e2 in increasing cost and sophistication.
enum class Heuristic : int {
  Material = 0,    // e0: piece values
  Positional = 1,  // e1: e0 + piece-square tables
  Safety = 2,      // e2: e1 + hanging-piece penalty and attack bonus
};

inline constexpr int VAL_PAWN   = 100;
inline constexpr int VAL_KNIGHT = 300;
inline constexpr int VAL_BISHOP = 300;
inline constexpr int VAL_QUEEN  = 900;
inline constexpr int VAL_KING   = 20000;

int piece_value(Piece p);

// Side-to-move agnostic score: positive = White better.
int evaluate(const Board& b, Heuristic h);

// Score from the point of view of the side to move (negamax convention).
int evaluate_stm(const Board& b, Heuristic h);

// Accepts "e0".."e2" or "material", "positional", "safety".
// Throws ConfigError for anything else.
Heuristic parse_heuristic(std::string_view id);
std::string heuristic_name(Heuristic h);

} // namespace minichess
