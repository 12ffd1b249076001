#pragma once
#include <cstdint>


namespace minichess {


using U64 = std::uint64_t;
using BB = std::uint32_t; // 25 squares
using Square = int; // 0..24


enum class Color : int { White = 0, Black = 1 };


enum class Piece : int { Pawn=0, Knight=1, Bishop=2, Queen=3, King=4, None=5 };


constexpr int COLOR_N = 2;
constexpr int PIECE_N = 5; // without None
constexpr int FILE_N = 5;
constexpr int RANK_N = 5;
constexpr int SQUARE_N = FILE_N * RANK_N;


inline constexpr int file_of(Square s) { return s % FILE_N; }
inline constexpr int rank_of(Square s) { return s / FILE_N; }
inline constexpr Square make_square(int file, int rank) { return rank * FILE_N + file; }
inline constexpr Square rotate_square(Square s) { return SQUARE_N - 1 - s; }
inline constexpr Color other(Color c) { return c == Color::White ? Color::Black : Color::White; }


} // namespace minichess
