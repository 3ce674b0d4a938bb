#pragma once

#include "grid.h"
#include "index.h"

#include <string>
#include <vector>

struct ValidationResult {
  bool ok = true;
  std::vector<std::string> messages;
};

/* Post-condition oracle for a finished grid.
 *
 * Every run is re-derived from raw cell state; nothing the generator
 * recorded about how the grid was built is trusted except where the check
 * is about that bookkeeping itself (licenses, registered slots, counters).
 * All violations are collected, not just the first. */
class GridValidator {
public:
  explicit GridValidator(const CandidateIndex &index_) : index(index_) {}

  ValidationResult validate(const Grid &grid,
                            const WordSet &themeWords = WordSet()) const;

private:
  struct Run {
    int row;
    int col;
    Direction direction;
    std::string text; // '.' for empty cells
  };

  std::vector<Run> collectRuns(const Grid &grid) const;

  void checkClueBoxes(const Grid &, std::vector<std::string> &) const;
  void checkCells(const Grid &, std::vector<std::string> &) const;
  void checkRuns(const Grid &, const std::vector<Run> &, const WordSet &,
                 std::vector<std::string> &) const;
  void checkCounters(const Grid &, std::vector<std::string> &) const;

  const CandidateIndex &index;
};
