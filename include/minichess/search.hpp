#pragma once

#include <cstdint>
#include <iosfwd>
#include <vector>

#include "minichess/board.hpp"
#include "minichess/eval.hpp"
#include "minichess/movegen.hpp"

namespace minichess {

// Scores at or beyond KING_CAPTURE_SCORE - MAX_PLY mean a forced king capture.
inline constexpr int INF = 1'000'000;
inline constexpr int KING_CAPTURE_SCORE = 900'000;
inline constexpr int MAX_PLY = 64;

enum class SearchStatus {
  Ok,            // at least one depth completed
  Fallback,      // budget ran out before depth 1 finished; best = first legal move
  NoLegalMoves,  // side has no moves; best is a null move
  GameOver,      // a king is already off the board; best is a null move
};

struct SearchResult {
  Move best{};
  int score{0};              // POV = searching side
  std::uint64_t nodes{0};    // cumulative over all iterations
  double seconds{0.0};
  int depth{0};              // last fully completed depth
  std::vector<Move> pv;      // principal variation, best line
  SearchStatus status{SearchStatus::Ok};
};

struct SearchConfig {
  double time_budget_s = 5.0;
  bool alpha_beta = true;
  Heuristic heuristic = Heuristic::Material;
  int max_depth = 0;                 // 0 => MAX_PLY
  std::ostream* info = nullptr;      // per-iteration "info ..." lines
};

// Throws ConfigError on a non-positive or non-finite budget, a negative depth,
// or a heuristic outside e0..e2.
void validate(const SearchConfig& cfg);

// Iterative deepening under cfg.time_budget_s. `side` is the side to search
// for; it overrides the board's side-to-move flag.
SearchResult search(const Board& root, Color side, const SearchConfig& cfg);
SearchResult search(const Board& root, Color side, double time_budget_s,
                    bool alpha_beta, Heuristic heuristic);

// One untimed pass at exactly `depth` for the board's side to move.
SearchResult search_fixed_depth(const Board& root, int depth, bool alpha_beta,
                                Heuristic heuristic);

const char* status_name(SearchStatus s);

} // namespace minichess
