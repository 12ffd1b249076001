#include "minichess/board.hpp"


namespace minichess {


Board::Board() { clear(); }


void Board::clear() {
for (auto& by_color : bb_) for (auto& b : by_color) b = 0U;
stm_ = Color::White;
halfmove_clock_ = 0;
fullmove_number_ = 1;
hash_ = 0ULL;
}


void Board::set_piece(Color c, Piece p, Square s) {
bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(p)] |= (1U << s);
hash_ ^= Zobrist::instance().piece_on[static_cast<std::size_t>(c)]
                                     [static_cast<std::size_t>(p)]
                                     [static_cast<std::size_t>(s)];
}


void Board::remove_piece(Color c, Piece p, Square s) {
bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(p)] &= ~(1U << s);
hash_ ^= Zobrist::instance().piece_on[static_cast<std::size_t>(c)]
                                     [static_cast<std::size_t>(p)]
                                     [static_cast<std::size_t>(s)];
}


void Board::set_side_to_move(Color c) {
if (c != stm_) hash_ ^= Zobrist::instance().side_to_move;
stm_ = c;
}


BB Board::occupancy(Color c) const {
BB occ = 0U;
for (BB b : bb_[static_cast<std::size_t>(c)]) occ |= b;
return occ;
}


Piece Board::piece_at(Square s, Color* c_out) const {
  for (int c = 0; c < COLOR_N; ++c) {
    for (int p = 0; p < PIECE_N; ++p) {
      if ((bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(p)] >> s) & 1U) {
        if (c_out) *c_out = static_cast<Color>(c);
        return static_cast<Piece>(p);
      }
    }
  }
  return Piece::None;
}


} // namespace minichess
