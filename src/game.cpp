#include "minichess/game.hpp"

#include "minichess/draw.hpp"
#include "minichess/fen.hpp"
#include "minichess/move_do.hpp"
#include "minichess/movegen.hpp"

#include <chrono>
#include <ostream>

namespace minichess {

const char* outcome_name(GameOutcome o) {
  switch (o) {
    case GameOutcome::Ongoing:  return "ongoing";
    case GameOutcome::WhiteWin: return "white wins";
    case GameOutcome::BlackWin: return "black wins";
    case GameOutcome::Draw:     return "draw";
  }
  return "unknown";
}

Game::Game() {
  set_from_fen(board_, STARTPOS_FEN);
  update_outcome_();
}

Game::Game(const Board& start) : board_(start) {
  update_outcome_();
}

MoveList Game::legal_moves() const {
  MoveList ml;
  generate_pseudo_legal(board_, ml);
  return ml;
}

void Game::apply(const Move& m) {
  if (over())
    throw GameError("game is over (" + reason_ + "), cannot play " + move_to_string(m));

  // Promotion is mandatory, so from/to identify a move.
  const MoveList ml = legal_moves();
  const Move* found = nullptr;
  for (const auto& cand : ml) {
    if (cand.from == m.from && cand.to == m.to) { found = &cand; break; }
  }
  if (!found)
    throw GameError("illegal move " + move_to_string(m) + " in " + to_fen(board_));

  State st{};
  do_move(board_, *found, st);
  moves_.push_back(*found);
  update_outcome_();
}

void Game::update_outcome_() {
  if (!board_.has_king(Color::White)) {
    outcome_ = GameOutcome::BlackWin;
    reason_  = "white king captured";
  } else if (!board_.has_king(Color::Black)) {
    outcome_ = GameOutcome::WhiteWin;
    reason_  = "black king captured";
  } else if (is_no_capture_draw(board_)) {
    outcome_ = GameOutcome::Draw;
    reason_  = "20 half-moves without a capture";
  } else if (legal_moves().empty()) {
    outcome_ = GameOutcome::Draw;
    reason_  = "side to move has no legal moves";
  } else {
    outcome_ = GameOutcome::Ongoing;
    reason_.clear();
  }
}

GameReport play_match(const Board& start, const PlayerConfig& white,
                      const PlayerConfig& black, int maxPlies, std::ostream* log) {
  using clock = std::chrono::steady_clock;

  GameReport rep;
  Game g(start);
  std::uint64_t nodesTotal = 0;

  const auto t0 = clock::now();

  for (int ply = 0; ply < maxPlies && !g.over(); ++ply) {
    const Color us = g.board().side_to_move();
    const PlayerConfig& pc = (us == Color::White ? white : black);

    SearchResult r = pc.fixed_depth > 0
      ? search_fixed_depth(g.board(), pc.fixed_depth, pc.search.alpha_beta, pc.search.heuristic)
      : search(g.board(), us, pc.search);
    nodesTotal += r.nodes;

    if (r.status == SearchStatus::NoLegalMoves || r.status == SearchStatus::GameOver)
      throw GameError(std::string("search found nothing to play in an ongoing game: ") +
                      status_name(r.status));

    g.apply(r.best);

    if (log) {
      *log << "ply " << (ply + 1)
           << ' ' << (us == Color::White ? "white" : "black")
           << ' ' << move_to_string(r.best)
           << " score " << r.score
           << " depth " << r.depth
           << " nodes " << r.nodes
           << " time " << static_cast<long long>(r.seconds * 1000.0)
           << ' ' << status_name(r.status) << '\n';
    }
  }

  rep.outcome = g.outcome();
  rep.reason  = g.over() ? g.reason() : "max plies reached";
  rep.moves   = g.moves();
  rep.plies   = static_cast<int>(rep.moves.size());
  rep.nodes   = nodesTotal;
  rep.seconds = std::chrono::duration<double>(clock::now() - t0).count();
  return rep;
}

} // namespace minichess
