#include "minichess/eval.hpp"
#include "minichess/attack.hpp"
#include "minichess/types.hpp"

#include <array>
#include <cctype>

namespace minichess {

// King counted at this value for safety terms only; its material value would
// drown every other term.
static constexpr int KING_SAFETY_VALUE = 1000;

// Piece-square tables from White's side, indexed rank * 5 + file with rank 0
// White's home rank. Black reads the rotated square.
using Table = std::array<int, SQUARE_N>;

static constexpr Table PST_PAWN = {
    0,   0,   0,   0,   0,
    0,   5,   5,   5,   0,
    5,  10,  15,  10,   5,
   20,  25,  30,  25,  20,
    0,   0,   0,   0,   0,
};

static constexpr Table PST_KNIGHT = {
  -20, -10, -10, -10, -20,
  -10,   5,  10,   5, -10,
  -10,  10,  20,  10, -10,
  -10,   5,  10,   5, -10,
  -20, -10, -10, -10, -20,
};

static constexpr Table PST_BISHOP = {
  -10,  -5,  -5,  -5, -10,
   -5,  10,   5,  10,  -5,
   -5,   5,  15,   5,  -5,
   -5,  10,   5,  10,  -5,
  -10,  -5,  -5,  -5, -10,
};

static constexpr Table PST_QUEEN = {
  -10,  -5,   0,  -5, -10,
   -5,   0,   5,   0,  -5,
    0,   5,  10,   5,   0,
   -5,   0,   5,   0,  -5,
  -10,  -5,   0,  -5, -10,
};

static constexpr Table PST_KING = {
   10,  15,   5,  15,  10,
    0,   0,  -5,   0,   0,
  -10, -15, -20, -15, -10,
  -20, -25, -30, -25, -20,
  -30, -30, -30, -30, -30,
};

int piece_value(Piece p) {
  switch (p) {
    case Piece::Pawn:   return VAL_PAWN;
    case Piece::Knight: return VAL_KNIGHT;
    case Piece::Bishop: return VAL_BISHOP;
    case Piece::Queen:  return VAL_QUEEN;
    case Piece::King:   return VAL_KING;
    default:            return 0;
  }
}

static inline int pst_value(Piece p, Color c, Square s) {
  const auto idx = static_cast<std::size_t>(c == Color::White ? s : rotate_square(s));
  switch (p) {
    case Piece::Pawn:   return PST_PAWN[idx];
    case Piece::Knight: return PST_KNIGHT[idx];
    case Piece::Bishop: return PST_BISHOP[idx];
    case Piece::Queen:  return PST_QUEEN[idx];
    case Piece::King:   return PST_KING[idx];
    default:            return 0;
  }
}

static inline int safety_value(Piece p) {
  return p == Piece::King ? KING_SAFETY_VALUE : piece_value(p);
}

static int material(const Board& b) {
  int score = 0;
  for (Square s = 0; s < SQUARE_N; ++s) {
    Color c; Piece p = b.piece_at(s, &c);
    if (p == Piece::None) continue;
    int v = piece_value(p);
    score += (c == Color::White ? v : -v);
  }
  return score;
}

static int placement(const Board& b) {
  int score = 0;
  for (Square s = 0; s < SQUARE_N; ++s) {
    Color c; Piece p = b.piece_at(s, &c);
    if (p == Piece::None) continue;
    int v = pst_value(p, c, s);
    score += (c == Color::White ? v : -v);
  }
  return score;
}

// Each attacked piece is worth value/8 as a threat to its owner and value/16
// as an initiative bonus to the attacker.
static int threat_sum(const Board& b, BB attacked) {
  int sum = 0;
  while (attacked) {
    const Square s = __builtin_ctz(attacked);
    const int v = safety_value(b.piece_at(s));
    sum += v / 8 + v / 16;
    attacked &= attacked - 1;
  }
  return sum;
}

static int safety(const Board& b) {
  const BB byWhite = attacked_pieces(b, Color::White);
  const BB byBlack = attacked_pieces(b, Color::Black);
  return threat_sum(b, byWhite) - threat_sum(b, byBlack);
}

int evaluate(const Board& b, Heuristic h) {
  switch (h) {
    case Heuristic::Material:   return material(b);
    case Heuristic::Positional: return material(b) + placement(b);
    case Heuristic::Safety:     return material(b) + placement(b) + safety(b);
  }
  throw ConfigError("unknown heuristic");
}

int evaluate_stm(const Board& b, Heuristic h) {
  const int e = evaluate(b, h);
  return b.side_to_move() == Color::White ? e : -e;
}

Heuristic parse_heuristic(std::string_view id) {
  std::string s;
  for (char c : id) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (s == "e0" || s == "material")   return Heuristic::Material;
  if (s == "e1" || s == "positional") return Heuristic::Positional;
  if (s == "e2" || s == "safety")     return Heuristic::Safety;
  throw ConfigError("unknown heuristic '" + std::string(id) + "' (expected e0, e1 or e2)");
}

std::string heuristic_name(Heuristic h) {
  switch (h) {
    case Heuristic::Material:   return "e0";
    case Heuristic::Positional: return "e1";
    case Heuristic::Safety:     return "e2";
  }
  return "e?";
}

} // namespace minichess
