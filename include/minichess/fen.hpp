#pragma once
#include <string>
#include <string_view>
#include <stdexcept>
#include "minichess/board.hpp"

namespace minichess {

struct FenError : std::runtime_error { using std::runtime_error::runtime_error; };

// 5x5 FEN: placement (rank 5 first), active colour, half-moves since the last
// capture, full-move number.
inline constexpr char STARTPOS_FEN[] = "kqbn1/2pp1/5/1PP2/1NBQK w 0 1";

void set_from_fen(Board& b, std::string_view fen);
std::string to_fen(const Board& b);

std::string square_to_string(Square s);

} // namespace minichess
