#pragma once

#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

#include "minichess/board.hpp"
#include "minichess/move.hpp"
#include "minichess/movelist.hpp"
#include "minichess/search.hpp"

namespace minichess {

struct GameError : std::runtime_error { using std::runtime_error::runtime_error; };

enum class GameOutcome { Ongoing, WhiteWin, BlackWin, Draw };

const char* outcome_name(GameOutcome o);

// Authoritative game state. Moves come either from a search or from an
// outside front end (a human player) and are checked against the generator.
class Game {
public:
  Game();
  explicit Game(const Board& start);

  const Board& board() const { return board_; }
  const std::vector<Move>& moves() const { return moves_; }
  GameOutcome outcome() const { return outcome_; }
  const std::string& reason() const { return reason_; }
  bool over() const { return outcome_ != GameOutcome::Ongoing; }

  MoveList legal_moves() const;

  // Throws GameError if the game is over or `m` is not a legal move. The
  // stored move is the generator's copy, so capture and promotion details are
  // filled in even when the caller passes only from/to.
  void apply(const Move& m);

private:
  void update_outcome_();

  Board board_;
  std::vector<Move> moves_;
  GameOutcome outcome_ = GameOutcome::Ongoing;
  std::string reason_;
};

struct PlayerConfig {
  SearchConfig search{};
  int fixed_depth = 0;   // > 0 => untimed search_fixed_depth, reproducible
};

struct GameReport {
  GameOutcome outcome = GameOutcome::Ongoing;
  int plies = 0;                       // number of half-moves played
  std::string reason;                  // human-readable termination reason
  std::vector<Move> moves;             // played moves
  std::uint64_t nodes = 0;             // total nodes searched across plies
  double seconds = 0.0;                // wall time spent in the game loop
};

// AI vs AI. Stops at a terminal condition or after maxPlies; a game cut by the
// ply cap is reported as Ongoing with reason "max plies reached". One line per
// ply goes to `log` when it is non-null.
GameReport play_match(const Board& start, const PlayerConfig& white,
                      const PlayerConfig& black, int maxPlies,
                      std::ostream* log = nullptr);

} // namespace minichess
