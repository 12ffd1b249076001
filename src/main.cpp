#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <cstdint>

#include "minichess/types.hpp"
#include "minichess/board.hpp"
#include "minichess/fen.hpp"
#include "minichess/perft.hpp"
#include "minichess/eval.hpp"
#include "minichess/search.hpp"
#include "minichess/game.hpp"

using namespace minichess;

static void usage() {
  std::cout <<
    "minichess CLI\n"
    "Usage:\n"
    "  minichess_cli perft <depth> [fen <FEN...>]\n"
    "  minichess_cli divide <depth> [fen <FEN...>]\n"
    "  minichess_cli eval [heuristic e0|e1|e2] [fen <FEN...>]\n"
    "  minichess_cli search [time <sec>] [depth <N>] [heuristic e0|e1|e2]\n"
    "                       [minimax|alphabeta] [quiet] [fen <FEN...>]\n"
    "  minichess_cli play [time <sec>] [depth <N>] [white e0|e1|e2] [black e0|e1|e2]\n"
    "                     [minimax|alphabeta] [plies <N>] [fen <FEN...>]\n"
    "If FEN omitted, uses the initial 5x5 position " << STARTPOS_FEN << ".\n";
}

static std::string join_from(const std::vector<std::string>& a, size_t i) {
  if (i >= a.size()) return "";
  std::ostringstream oss;
  for (size_t k = i; k < a.size(); ++k) {
    if (k > i) oss << ' ';
    oss << a[k];
  }
  return oss.str();
}

static Board board_from_args(const std::vector<std::string>& a, size_t fenStart) {
  Board b;
  if (fenStart < a.size()) set_from_fen(b, join_from(a, fenStart));
  else set_from_fen(b, STARTPOS_FEN);
  return b;
}

static int to_int(const std::string& key, const std::string& s) {
  try {
    return std::stoi(s);
  } catch (const std::logic_error&) {
    throw ConfigError("expected an integer for '" + key + "', got '" + s + "'");
  }
}

static double to_double(const std::string& key, const std::string& s) {
  try {
    return std::stod(s);
  } catch (const std::logic_error&) {
    throw ConfigError("expected a number for '" + key + "', got '" + s + "'");
  }
}

// Shared options of `search` and `play`.
struct CliOptions {
  SearchConfig cfg{};
  Heuristic white = Heuristic::Material;
  Heuristic black = Heuristic::Material;
  int depth = 0;          // > 0 with no time given => untimed fixed depth
  bool timeGiven = false;
  bool quiet = false;
  int plies = 200;
  size_t fenStart = 0;
};

static CliOptions parse_options(const std::vector<std::string>& args) {
  CliOptions o;
  o.fenStart = args.size();

  for (size_t i = 1; i < args.size(); ++i) {
    const std::string& tok = args[i];

    if (tok == "fen")       { o.fenStart = i + 1; break; }
    if (tok == "minimax")   { o.cfg.alpha_beta = false; continue; }
    if (tok == "alphabeta") { o.cfg.alpha_beta = true;  continue; }
    if (tok == "quiet")     { o.quiet = true; continue; }
    if (i + 1 >= args.size()) throw ConfigError("missing value for '" + tok + "'");

    const std::string& val = args[i + 1];

    if (tok == "time")           { o.cfg.time_budget_s = to_double(tok, val); o.timeGiven = true; ++i; continue; }
    if (tok == "depth")          { o.depth = to_int(tok, val); ++i; continue; }
    if (tok == "heuristic")      { o.cfg.heuristic = parse_heuristic(val); o.white = o.black = o.cfg.heuristic; ++i; continue; }
    if (tok == "white")          { o.white = parse_heuristic(val); ++i; continue; }
    if (tok == "black")          { o.black = parse_heuristic(val); ++i; continue; }
    if (tok == "plies")          { o.plies = to_int(tok, val); ++i; continue; }
    throw ConfigError("unknown option '" + tok + "'");
  }
  if (o.depth < 0) throw ConfigError("depth must not be negative");
  if (o.plies < 0) throw ConfigError("plies must not be negative");
  o.cfg.max_depth = o.depth;
  validate(o.cfg);
  return o;
}

static PlayerConfig player(const CliOptions& o, Heuristic h) {
  PlayerConfig pc;
  pc.search = o.cfg;
  pc.search.heuristic = h;
  pc.search.info = nullptr;
  if (o.depth > 0 && !o.timeGiven) pc.fixed_depth = o.depth;
  return pc;
}

static void print_result(const SearchResult& r) {
  std::cout << "best " << (r.status == SearchStatus::Ok || r.status == SearchStatus::Fallback
                             ? move_to_string(r.best) : std::string("(none)"))
            << " score " << r.score
            << " depth " << r.depth
            << " nodes " << r.nodes
            << " time " << r.seconds
            << " status " << status_name(r.status)
            << " pv ";
  for (auto& m : r.pv) std::cout << move_to_string(m) << ' ';
  std::cout << "\n";
}

static int run(const std::vector<std::string>& args) {
  const std::string cmd = args[0];

  // perft <depth> [fen...]
  if (cmd == "perft" || cmd == "divide") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = to_int("depth", args[1]);
    size_t fenStart = args.size();
    if (args.size() > 2) {
      if (args[2] != "fen") throw ConfigError("expected 'fen' after the depth");
      fenStart = 3;
    }
    Board b = board_from_args(args, fenStart);
    if (cmd == "perft") {
      std::cout << perft(b, depth) << "\n";
      return 0;
    }
    std::vector<std::pair<Move, std::uint64_t>> parts;
    perft_divide(b, depth, parts);
    std::uint64_t total = 0;
    for (auto& [m, n] : parts) {
      std::cout << move_to_string(m) << " " << n << "\n";
      total += n;
    }
    std::cout << "total " << total << "\n";
    return 0;
  }

  // eval [heuristic h] [fen...]
  if (cmd == "eval") {
    CliOptions o = parse_options(args);
    Board b = board_from_args(args, o.fenStart);
    const int score = evaluate(b, o.cfg.heuristic);
    std::cout << "eval " << score << " " << heuristic_name(o.cfg.heuristic)
              << " (" << (b.side_to_move() == Color::White ? "white" : "black") << " to move)\n";
    return 0;
  }

  // search [time s] [depth N] [heuristic h] [minimax|alphabeta] [fen...]
  if (cmd == "search") {
    CliOptions o = parse_options(args);
    Board b = board_from_args(args, o.fenStart);
    SearchResult r;
    if (o.depth > 0 && !o.timeGiven) {
      r = search_fixed_depth(b, o.depth, o.cfg.alpha_beta, o.cfg.heuristic);
    } else {
      if (!o.quiet) o.cfg.info = &std::cout;
      r = search(b, b.side_to_move(), o.cfg);
    }
    print_result(r);
    return 0;
  }

  // play: AI vs AI from the given position
  if (cmd == "play") {
    CliOptions o = parse_options(args);
    Board b = board_from_args(args, o.fenStart);
    GameReport rep = play_match(b, player(o, o.white), player(o, o.black), o.plies,
                                o.quiet ? nullptr : &std::cout);
    std::cout << "result " << outcome_name(rep.outcome)
              << " (" << rep.reason << ")"
              << " plies " << rep.plies
              << " nodes " << rep.nodes
              << " time " << rep.seconds << "\n";
    return 0;
  }

  usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) { usage(); return 0; }

  try {
    return run(args);
  } catch (const ConfigError& e) {
    std::cerr << "config error: " << e.what() << "\n";
  } catch (const FenError& e) {
    std::cerr << "bad position: " << e.what() << "\n";
  } catch (const GameError& e) {
    std::cerr << "game error: " << e.what() << "\n";
  }
  return 1;
}
