#include "minichess/fen.hpp"
#include "minichess/move.hpp"
#include <sstream>
#include <string>   // ensure operator>> into std::string is visible

namespace minichess {

static inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

static int to_int(const std::string& s, const char* what) {
  try {
    std::size_t used = 0;
    const int v = std::stoi(s, &used);
    if (used != s.size() || v < 0) throw FenError(std::string("Invalid ") + what + " in FEN");
    return v;
  } catch (const std::logic_error&) {
    throw FenError(std::string("Invalid ") + what + " in FEN");
  }
}

static inline Piece char_to_piece(char c, Color& out_color) {
  switch (c) {
    case 'P': out_color = Color::White; return Piece::Pawn;
    case 'N': out_color = Color::White; return Piece::Knight;
    case 'B': out_color = Color::White; return Piece::Bishop;
    case 'Q': out_color = Color::White; return Piece::Queen;
    case 'K': out_color = Color::White; return Piece::King;
    case 'p': out_color = Color::Black; return Piece::Pawn;
    case 'n': out_color = Color::Black; return Piece::Knight;
    case 'b': out_color = Color::Black; return Piece::Bishop;
    case 'q': out_color = Color::Black; return Piece::Queen;
    case 'k': out_color = Color::Black; return Piece::King;
    default:  out_color = Color::White; return Piece::None;
  }
}

static inline char piece_to_char(Piece p, Color c) {
  const char* W = "PNBQK";
  const char* B = "pnbqk";
  if (p == Piece::None) return '.';
  int idx = static_cast<int>(p);
  return (c == Color::White ? W[idx] : B[idx]);
}

std::string square_to_string(Square s) {
  std::string out;
  out += char('a' + file_of(s));
  out += char('1' + rank_of(s));
  return out;
}

std::string move_to_string(const Move& m) {
  std::string s = square_to_string(m.from) + square_to_string(m.to);
  if (m.promo == Piece::Queen) s.push_back('q');
  return s;
}

void set_from_fen(Board& b, std::string_view fen) {
  b.clear();

  std::string fen_str(fen);
  std::istringstream ss(fen_str);
  std::string placement, active, half = "0", full = "1";
  if (!(ss >> placement >> active))
    throw FenError("Malformed FEN: expected placement and active colour");
  ss >> half >> full; // clocks are optional

  // 1) Piece placement
  int r = RANK_N - 1, f = 0;
  for (char ch : placement) {
    if (ch == '/') {
      if (f != FILE_N) throw FenError("FEN rank does not cover 5 files");
      --r; f = 0;
      continue;
    }
    if (r < 0) throw FenError("Too many ranks in FEN");
    if (is_digit(ch)) {
      f += ch - '0';
      if (ch == '0' || f > FILE_N) throw FenError("Invalid empty-square count in FEN");
      continue;
    }
    Color col; Piece p = char_to_piece(ch, col);
    if (p == Piece::None) throw FenError("Invalid piece character in FEN");
    if (f >= FILE_N) throw FenError("Square out of range while parsing FEN");
    b.set_piece(col, p, make_square(f, r));
    ++f;
  }
  if (r != 0 || f != FILE_N) throw FenError("FEN placement must describe 5 ranks of 5 files");

  // 2) Active color
  if (active == "w") b.set_side_to_move(Color::White);
  else if (active == "b") b.set_side_to_move(Color::Black);
  else throw FenError("Invalid active color in FEN");

  // 3) Half-moves since capture & 4) fullmove number
  b.set_halfmove_clock(to_int(half, "halfmove clock"));
  b.set_fullmove_number(to_int(full, "fullmove number"));
}

std::string to_fen(const Board& b) {
  std::string out;

  // 1) Piece placement
  for (int r = RANK_N - 1; r >= 0; --r) {
    int empties = 0;
    for (int f = 0; f < FILE_N; ++f) {
      Color c;
      Piece p = b.piece_at(make_square(f, r), &c);
      if (p == Piece::None) {
        ++empties;
      } else {
        if (empties) { out += char('0' + empties); empties = 0; }
        out += piece_to_char(p, c);
      }
    }
    if (empties) out += char('0' + empties);
    if (r) out += '/';
  }
  out += ' ';

  // 2) Active color
  out += (b.side_to_move() == Color::White ? 'w' : 'b');
  out += ' ';

  // 3) Half-moves since capture & 4) Fullmove
  out += std::to_string(b.halfmove_clock());
  out += ' ';
  out += std::to_string(b.fullmove_number());

  return out;
}

} // namespace minichess
