#include "minichess/search.hpp"
#include "minichess/draw.hpp"
#include "minichess/eval.hpp"
#include "minichess/move_do.hpp"
#include "minichess/movegen.hpp"
#include "minichess/types.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace minichess {
namespace {

using Clock = std::chrono::steady_clock;

// Keeps the deadline arithmetic inside steady_clock's range.
constexpr double MAX_BUDGET_S = 24.0 * 3600.0;

// -----------------------------------------------------------------------------
// Per-call state; one per search() invocation, never shared.
// -----------------------------------------------------------------------------
struct Context {
  Heuristic heuristic{Heuristic::Material};
  bool alpha_beta{true};
  bool has_deadline{false};
  Clock::time_point deadline{};
  std::uint64_t nodes{0};
  bool aborted{false};
  bool horizon{false};   // a node with moves left was cut by the depth limit

  bool out_of_time() {
    if (!aborted && has_deadline && Clock::now() >= deadline) aborted = true;
    return aborted;
  }
};

inline bool is_king_capture_score(int score) {
  return std::abs(score) >= KING_CAPTURE_SCORE - MAX_PLY;
}

inline double seconds_since(Clock::time_point t0) {
  return std::chrono::duration<double>(Clock::now() - t0).count();
}

// -----------------------------------------------------------------------------
// Negamax, optionally with alpha-beta. Moves are tried in generation order and
// only a strictly better score replaces the best move, so ties go to the
// earliest generated move. Every do_move is undone before returning.
// -----------------------------------------------------------------------------
int negamax(Board& b, int depth, int alpha, int beta, int ply,
            Context& ctx, std::vector<Move>& pv)
{
  pv.clear();
  if (ctx.out_of_time()) return 0;
  ctx.nodes++;

  const Color us = b.side_to_move();

  // The previous mover took our king; sooner is worse for us.
  if (!b.has_king(us)) return -(KING_CAPTURE_SCORE - ply);
  if (is_no_capture_draw(b)) return 0;

  if (depth == 0) {
    ctx.horizon = true;
    return evaluate_stm(b, ctx.heuristic);
  }

  MoveList ml;
  generate_pseudo_legal(b, ml);
  if (ml.empty()) return evaluate_stm(b, ctx.heuristic);

  Move bestMove{};
  std::vector<Move> bestChildPV;
  std::vector<Move> childPV;
  int bestScore = -INF;

  for (const auto& m : ml) {
    State st{};
    do_move(b, m, st);
    const int score = -negamax(b, depth - 1, -beta, -alpha, ply + 1, ctx, childPV);
    undo_move(b, m, st);

    if (ctx.aborted) return 0;

    if (score > bestScore) {
      bestScore   = score;
      bestMove    = m;
      bestChildPV = childPV;
    }

    if (ctx.alpha_beta) {
      if (bestScore > alpha) alpha = bestScore;
      if (alpha >= beta) break;
    }
  }

  pv.push_back(bestMove);
  pv.insert(pv.end(), bestChildPV.begin(), bestChildPV.end());
  return bestScore;
}

void print_info(std::ostream& out, const SearchResult& r) {
  out << "info depth " << r.depth
      << " score " << r.score
      << " nodes " << r.nodes
      << " time " << static_cast<long long>(r.seconds * 1000.0)
      << " pv";
  for (const auto& m : r.pv) out << ' ' << move_to_string(m);
  out << '\n';
}

// Root checks shared by both entry points. Returns false when there is
// nothing to search; `res` then carries the terminal status.
bool prepare_root(const Board& b, Heuristic h, MoveList& rootMoves, SearchResult& res) {
  if (king_captured(b) || is_no_capture_draw(b)) {
    res.status = SearchStatus::GameOver;
    return false;
  }
  generate_pseudo_legal(b, rootMoves);
  if (rootMoves.empty()) {
    res.status = SearchStatus::NoLegalMoves;
    res.score  = evaluate_stm(b, h);
    return false;
  }
  return true;
}

} // namespace

// A zero budget is refused; the first-legal-move fallback is reached with a
// positive budget too small for depth 1 to finish.
void validate(const SearchConfig& cfg) {
  if (!std::isfinite(cfg.time_budget_s) || cfg.time_budget_s <= 0.0)
    throw ConfigError("time budget must be a positive number of seconds");
  if (cfg.max_depth < 0)
    throw ConfigError("max depth must not be negative");
  const int h = static_cast<int>(cfg.heuristic);
  if (h < static_cast<int>(Heuristic::Material) || h > static_cast<int>(Heuristic::Safety))
    throw ConfigError("unknown heuristic id " + std::to_string(h));
}

// ============================================================================
// Iterative deepening under a wall-clock budget
// ============================================================================
SearchResult search(const Board& root, Color side, const SearchConfig& cfg) {
  validate(cfg);

  const auto t0 = Clock::now();
  const double budget = std::min(cfg.time_budget_s, MAX_BUDGET_S);

  Context ctx;
  ctx.heuristic    = cfg.heuristic;
  ctx.alpha_beta   = cfg.alpha_beta;
  ctx.has_deadline = true;
  ctx.deadline     = t0 + std::chrono::duration_cast<Clock::duration>(
                            std::chrono::duration<double>(budget));

  const int maxDepth = cfg.max_depth > 0 ? std::min(cfg.max_depth, MAX_PLY) : MAX_PLY;

  SearchResult res{};
  Board b = root;
  b.set_side_to_move(side);

  MoveList rootMoves;
  if (!prepare_root(b, cfg.heuristic, rootMoves, res)) {
    res.seconds = seconds_since(t0);
    return res;
  }

  // Degenerate path: nothing completes, so the first legal move stands.
  res.best   = rootMoves[0];
  res.pv     = {rootMoves[0]};
  res.score  = evaluate_stm(b, cfg.heuristic);
  res.status = SearchStatus::Fallback;

  for (int d = 1; d <= maxDepth; ++d) {
    if (ctx.out_of_time()) break;

    ctx.horizon = false;
    std::vector<Move> pv;
    const int score = negamax(b, d, -INF, +INF, 0, ctx, pv);
    if (ctx.aborted) break; // keep the last completed depth

    res.best   = pv.front();
    res.pv     = std::move(pv);
    res.score  = score;
    res.depth  = d;
    res.status = SearchStatus::Ok;

    if (cfg.info) {
      res.nodes   = ctx.nodes;
      res.seconds = seconds_since(t0);
      print_info(*cfg.info, res);
    }

    if (!ctx.horizon) break;                 // the whole game tree fit
    if (is_king_capture_score(score)) break; // forced result, deeper cannot change it
  }

  res.nodes   = ctx.nodes;
  res.seconds = seconds_since(t0);
  return res;
}

SearchResult search(const Board& root, Color side, double time_budget_s,
                    bool alpha_beta, Heuristic heuristic) {
  SearchConfig cfg;
  cfg.time_budget_s = time_budget_s;
  cfg.alpha_beta    = alpha_beta;
  cfg.heuristic     = heuristic;
  return search(root, side, cfg);
}

SearchResult search_fixed_depth(const Board& root, int depth, bool alpha_beta,
                                Heuristic heuristic) {
  if (depth < 1 || depth > MAX_PLY)
    throw ConfigError("fixed search depth must be between 1 and " + std::to_string(MAX_PLY));
  SearchConfig check;
  check.heuristic = heuristic;
  validate(check);

  const auto t0 = Clock::now();

  Context ctx;
  ctx.heuristic  = heuristic;
  ctx.alpha_beta = alpha_beta;

  SearchResult res{};
  Board b = root;

  MoveList rootMoves;
  if (prepare_root(b, heuristic, rootMoves, res)) {
    std::vector<Move> pv;
    res.score  = negamax(b, depth, -INF, +INF, 0, ctx, pv);
    res.best   = pv.front();
    res.pv     = std::move(pv);
    res.depth  = depth;
    res.status = SearchStatus::Ok;
  }

  res.nodes   = ctx.nodes;
  res.seconds = seconds_since(t0);
  return res;
}

const char* status_name(SearchStatus s) {
  switch (s) {
    case SearchStatus::Ok:           return "ok";
    case SearchStatus::Fallback:     return "fallback";
    case SearchStatus::NoLegalMoves: return "no-legal-moves";
    case SearchStatus::GameOver:     return "game-over";
  }
  return "unknown";
}

} // namespace minichess
