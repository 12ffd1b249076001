#include "minichess/movegen.hpp"
#include "minichess/types.hpp"
#include "minichess/board.hpp"

namespace minichess {

static inline bool on_board(int f, int r) { return f >= 0 && f < FILE_N && r >= 0 && r < RANK_N; }

// Diagonals first, then orthogonals; queens walk all eight.
static constexpr int DF[8] = {+1, +1, -1, -1, +1, -1,  0,  0};
static constexpr int DR[8] = {+1, -1, +1, -1,  0,  0, +1, -1};

static constexpr int KN_DF[8] = {+1, -1, +2, -2, +2, -2, +1, -1};
static constexpr int KN_DR[8] = {+2, +2, +1, +1, -1, -1, -2, -2};

static inline void push_to(const Board& b, Color us, Square s, Square t, MoveList& out) {
  Color oc; Piece op = b.piece_at(t, &oc);
  if (op == Piece::None) out.push(Move{ s, t, MoveFlag::Quiet, Piece::None, Piece::None });
  else if (oc != us)     out.push(Move{ s, t, MoveFlag::Capture, op, Piece::None });
}

static void gen_slider(const Board& b, Color us, Square s, int firstDir, int lastDir, MoveList& out) {
  const int f0 = file_of(s), r0 = rank_of(s);
  for (int dir = firstDir; dir < lastDir; ++dir) {
    int f = f0 + DF[dir], r = r0 + DR[dir];
    while (on_board(f, r)) {
      const Square t = make_square(f, r);
      Color oc; Piece op = b.piece_at(t, &oc);
      if (op == Piece::None) {
        out.push(Move{ s, t, MoveFlag::Quiet, Piece::None, Piece::None });
      } else {
        if (oc != us) out.push(Move{ s, t, MoveFlag::Capture, op, Piece::None });
        break; // blocked
      }
      f += DF[dir]; r += DR[dir];
    }
  }
}

static void gen_pawn(const Board& b, Color us, Square s, MoveList& out) {
  const int f0 = file_of(s), r0 = rank_of(s);
  const int fwd = (us == Color::White ? +1 : -1);
  const int r1 = r0 + fwd;
  if (r1 < 0 || r1 >= RANK_N) return;
  const bool promo = (r1 == (us == Color::White ? RANK_N - 1 : 0));

  const Square one = make_square(f0, r1);
  if (b.piece_at(one) == Piece::None) {
    if (promo) out.push(Move{ s, one, MoveFlag::Promotion, Piece::None, Piece::Queen });
    else       out.push(Move{ s, one, MoveFlag::Quiet, Piece::None, Piece::None });
  }
  for (int df : {-1, +1}) {
    const int nf = f0 + df;
    if (nf < 0 || nf >= FILE_N) continue;
    const Square t = make_square(nf, r1);
    Color oc; Piece op = b.piece_at(t, &oc);
    if (op == Piece::None || oc == us) continue;
    if (promo) out.push(Move{ s, t, MoveFlag::CapturePromotion, op, Piece::Queen });
    else       out.push(Move{ s, t, MoveFlag::Capture, op, Piece::None });
  }
}

void generate_moves(const Board& b, Color us, MoveList& out) {
  out.clear();

  for (Square s = 0; s < SQUARE_N; ++s) {
    Color pcColor; Piece pc = b.piece_at(s, &pcColor);
    if (pc == Piece::None || pcColor != us) continue;

    switch (pc) {
      case Piece::King: {
        const int f0 = file_of(s), r0 = rank_of(s);
        for (int dir = 0; dir < 8; ++dir) {
          const int f = f0 + DF[dir], r = r0 + DR[dir];
          if (on_board(f, r)) push_to(b, us, s, make_square(f, r), out);
        }
        break;
      }
      case Piece::Queen:  gen_slider(b, us, s, 0, 8, out); break;
      case Piece::Bishop: gen_slider(b, us, s, 0, 4, out); break;
      case Piece::Knight: {
        const int f0 = file_of(s), r0 = rank_of(s);
        for (int k = 0; k < 8; ++k) {
          const int f = f0 + KN_DF[k], r = r0 + KN_DR[k];
          if (on_board(f, r)) push_to(b, us, s, make_square(f, r), out);
        }
        break;
      }
      case Piece::Pawn: gen_pawn(b, us, s, out); break;
      default: break;
    }
  }
}

void generate_pseudo_legal(const Board& b, MoveList& out) {
  generate_moves(b, b.side_to_move(), out);
}

} // namespace minichess
