#pragma once
#include <array>
#include <cstdint>
#include "minichess/types.hpp"
#include "minichess/zobrist.hpp"


namespace minichess {


class Board {
public:
Board();
void clear();


void set_piece(Color c, Piece p, Square s);
void remove_piece(Color c, Piece p, Square s);
Piece piece_at(Square s, Color* c_out = nullptr) const;


BB pieces(Color c, Piece p) const { return bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(p)]; }
BB occupancy(Color c) const;
bool has_king(Color c) const { return pieces(c, Piece::King) != 0; }


void set_side_to_move(Color c);
Color side_to_move() const { return stm_; }


// Half-moves since the last capture.
void set_halfmove_clock(int v) { halfmove_clock_ = v; }
int halfmove_clock() const { return halfmove_clock_; }


void set_fullmove_number(int v) { fullmove_number_ = v; }
int fullmove_number() const { return fullmove_number_; }


U64 hash() const { return hash_; }


private:
// bitboards[color][piece]
std::array<std::array<BB, PIECE_N>, COLOR_N> bb_{};
Color stm_ = Color::White;
int halfmove_clock_ = 0;
int fullmove_number_ = 1;
U64 hash_ = 0ULL;
};


} // namespace minichess
