#pragma once

#include "model.h"

#include <chrono>
#include <memory>
#include <vector>

enum class SolveStatus { Feasible, Infeasible, Timeout };

const char *solveStatusName(SolveStatus status);

struct SolveResult {
  SolveStatus status = SolveStatus::Infeasible;
  std::vector<int> values; // one per model variable when Feasible
  long numCalls = 0;
};

/* Anything that can close a Model. solve() blocks for at most budgetSeconds
 * of wall clock and must report Timeout rather than overrun it. */
class ConstraintSolver {
public:
  virtual ~ConstraintSolver() = default;
  virtual SolveResult solve(const Model &model, double budgetSeconds) const = 0;
};

/* Serial depth-first search over table constraints.
 *
 * The search space holds, for every table, the indices of its tuples still
 * consistent with the letters assigned so far. At each step the unsolved
 * table with the fewest live tuples is expanded; every guess prunes the
 * tables sharing a variable with it and the branch dies as soon as one of
 * them runs empty. Disjunctions are checked once all their terms are set. */
class BacktrackingSolver : public ConstraintSolver {
public:
  explicit BacktrackingSolver(int verbosity_ = 1) : verbosity(verbosity_) {}

  SolveResult solve(const Model &model, double budgetSeconds) const override;

private:
  int verbosity;
};
