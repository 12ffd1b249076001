#pragma once
#include <cstdint>
#include <string>
#include "minichess/types.hpp"


namespace minichess {


enum class MoveFlag : uint8_t {
Quiet = 0,
Capture = 1 << 0,
Promotion = 1 << 1,
CapturePromotion = Capture | Promotion,
};


inline constexpr bool has_flag(MoveFlag f, MoveFlag bit) {
return (static_cast<uint8_t>(f) & static_cast<uint8_t>(bit)) != 0;
}


struct Move {
Square from{0};
Square to{0};
MoveFlag flags{MoveFlag::Quiet};
Piece captured{Piece::None};
Piece promo{Piece::None};
};


inline bool same_move(const Move& a, const Move& b) {
return a.from == b.from && a.to == b.to && a.promo == b.promo;
}


inline bool is_null_move(const Move& m) {
return m.from == m.to;
}


// Coordinate form such as "b2b3" or "c4c5q". Formatting only.
std::string move_to_string(const Move& m);


} // namespace minichess
