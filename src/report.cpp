#include "ggtl/report.hpp"

#include <chrono>
#include <sstream>
#include <string>

namespace ggtl::search {

std::string_view to_string(Status status) noexcept {
  switch (status) {
  case Status::Moved:
    return "moved";
  case Status::NoLegalMoves:
    return "no-legal-moves";
  case Status::NoImprovement:
    return "no-improvement";
  }
  return "unknown";
}

StreamReporter::StreamReporter(std::ostream& out, bool cutoffs) : out_(&out), cutoffs_(cutoffs) {}

void StreamReporter::search_started(const Start& start) {
  std::ostringstream line;
  line << "info search ply " << start.ply;
  if (start.explicit_ply) {
    line << " (overrides default " << start.default_ply << ")";
  }
  line << " moves " << start.root_moves << " window " << start.alpha << ' ' << start.beta;
  *out_ << line.str() << '\n' << std::flush;
}

void StreamReporter::root_move_scored(const RootMove& root_move) {
  std::ostringstream line;
  line << "info move " << root_move.index << " score " << root_move.score;
  if (root_move.improved) {
    line << " > " << root_move.alpha << " new best";
  }
  *out_ << line.str() << '\n' << std::flush;
}

void StreamReporter::cutoff(const Cutoff& cutoff) {
  if (!cutoffs_) {
    return;
  }
  *out_ << "info cutoff depth " << cutoff.depth << " move " << cutoff.index << " alpha "
        << cutoff.alpha << " beta " << cutoff.beta << '\n'
        << std::flush;
}

void StreamReporter::search_completed(const Summary& summary) {
  const auto elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(summary.elapsed).count();

  std::ostringstream line;
  line << "info done " << to_string(summary.status) << " nodes " << summary.stats.nodes
       << " terminal " << summary.stats.terminal_hits;
  if (summary.best_index.has_value()) {
    line << " best " << *summary.best_index;
  }
  if (summary.score.has_value()) {
    line << " score " << *summary.score;
  }
  line << " time " << elapsed_ms;
  *out_ << line.str() << '\n' << std::flush;
}

} // namespace ggtl::search
