#include "solver.h"

#include <iostream>
#include <set>

namespace {

using Clock = std::chrono::steady_clock;

// indices into a table's tuples that are still possible
using TupleList = std::vector<int>;

using SearchSpace = std::vector<std::shared_ptr<const TupleList>>;

// value per model variable, -1 while unassigned
using Assignment = std::vector<int>;

class Search {

public:
  Search(const Model &model_, Clock::time_point deadline_);

  const Assignment &getSolution() const { return solution; }
  bool timedOut() const { return expired; }
  long getNumCalls() const { return numCalls; }

  // nullptr if some table has no tuples at all
  std::unique_ptr<SearchSpace> initialSearchSpace() const;
  bool solve(const SearchSpace &, const Assignment &, std::vector<bool> solved);

private:
  // nullptr if a table runs empty or the deadline passes while filtering
  std::unique_ptr<SearchSpace>
  computeNewSearchSpaceGivenGuess(const SearchSpace &, const Assignment &,
                                  const std::vector<int> &changed);
  bool pastDeadline();
  bool disjunctionsHold(const Assignment &,
                        const std::vector<int> &changed) const;

  const Model &model;
  // the model's tables plus a domain table for every variable no table
  // mentions, so every variable gets assigned by the search
  std::vector<TableConstraint> tables;
  std::vector<std::vector<int>> tablesByVar;
  std::vector<std::vector<int>> disjunctionsByVar;
  Assignment solution;
  const Clock::time_point deadline;
  bool expired;
  long numCalls;
};

int termValue(const Term &term, const Assignment &assignment) {
  return term.isVariable() ? assignment[term.var] : term.value;
}

bool consistent(const TableConstraint &table, const std::vector<int> &tuple,
                const Assignment &assignment) {
  for (size_t k = 0; k != table.vars.size(); ++k) {
    const int value = assignment[table.vars[k]];
    if (value >= 0 && value != tuple[k]) {
      return false;
    }
  }
  return true;
}

} // namespace

const char *solveStatusName(SolveStatus status) {
  switch (status) {
  case SolveStatus::Feasible:
    return "FEASIBLE";
  case SolveStatus::Timeout:
    return "TIMEOUT";
  case SolveStatus::Infeasible:
    break;
  }
  return "INFEASIBLE";
}

Search::Search(const Model &model_, Clock::time_point deadline_)
    : model(model_), tables(model_.tables),
      tablesByVar(model_.variables.size()),
      disjunctionsByVar(model_.variables.size()), deadline(deadline_),
      expired(false), numCalls(0) {
  for (size_t t = 0; t != tables.size(); ++t) {
    for (int var : tables[t].vars) {
      tablesByVar[var].push_back(static_cast<int>(t));
    }
  }
  for (size_t v = 0; v != model.variables.size(); ++v) {
    if (!tablesByVar[v].empty()) {
      continue;
    }
    const Variable &variable = model.variables[v];
    TableConstraint domain;
    domain.vars.push_back(static_cast<int>(v));
    for (int value = variable.lo; value <= variable.hi; ++value) {
      domain.tuples.push_back(std::vector<int>(1, value));
    }
    tablesByVar[v].push_back(static_cast<int>(tables.size()));
    tables.push_back(domain);
  }
  for (size_t d = 0; d != model.disjunctions.size(); ++d) {
    std::set<int> vars;
    for (const Inequality &inequality : model.disjunctions[d].anyOf) {
      if (inequality.lhs.isVariable()) {
        vars.insert(inequality.lhs.var);
      }
      if (inequality.rhs.isVariable()) {
        vars.insert(inequality.rhs.var);
      }
    }
    for (int var : vars) {
      disjunctionsByVar[var].push_back(static_cast<int>(d));
    }
  }
}

std::unique_ptr<SearchSpace> Search::initialSearchSpace() const {
  std::unique_ptr<SearchSpace> retval(std::make_unique<SearchSpace>());
  for (const TableConstraint &table : tables) {
    if (table.tuples.empty()) {
      return nullptr;
    }
    auto list = std::make_shared<TupleList>();
    for (size_t i = 0; i != table.tuples.size(); ++i) {
      list->push_back(static_cast<int>(i));
    }
    retval->push_back(list);
  }
  return retval;
}

bool Search::disjunctionsHold(const Assignment &assignment,
                              const std::vector<int> &changed) const {
  for (int var : changed) {
    for (int d : disjunctionsByVar[var]) {
      bool allSet = true;
      bool anyDiffers = false;
      for (const Inequality &inequality : model.disjunctions[d].anyOf) {
        const int lhs = termValue(inequality.lhs, assignment);
        const int rhs = termValue(inequality.rhs, assignment);
        if (lhs < 0 || rhs < 0) {
          allSet = false;
        } else if (lhs != rhs) {
          anyDiffers = true;
          break;
        }
      }
      if (allSet && !anyDiffers) {
        return false;
      }
    }
  }
  return true;
}

std::unique_ptr<SearchSpace>
Search::computeNewSearchSpaceGivenGuess(const SearchSpace &currentSearchSpace,
                                        const Assignment &assignment,
                                        const std::vector<int> &changed) {
  std::unique_ptr<SearchSpace> retval(
      std::make_unique<SearchSpace>(currentSearchSpace));

  std::set<int> affected;
  for (int var : changed) {
    affected.insert(tablesByVar[var].begin(), tablesByVar[var].end());
  }
  for (int t : affected) {
    const TableConstraint &table = tables[t];
    auto dstList = std::make_shared<TupleList>();
    size_t scanned = 0;
    for (int i : *currentSearchSpace[t]) {
      if (++scanned % 4096 == 0 && pastDeadline()) {
        return nullptr;
      }
      if (consistent(table, table.tuples[i], assignment)) {
        dstList->push_back(i);
      }
    }
    if (dstList->empty()) {
      // if we got rid of every tuple of a table clearly this guess can't be
      // correct, we won't be able to satisfy that table
      return nullptr;
    }
    (*retval)[t] = dstList;
  }
  return retval;
}

bool Search::pastDeadline() {
  if (!expired && Clock::now() > deadline) {
    expired = true;
  }
  return expired;
}

bool Search::solve(const SearchSpace &searchSpace, const Assignment &assignment,
                   std::vector<bool> solved) {
  // invariant upon calling Search::solve: the current state is valid
  if (numCalls++ % 256 == 0) {
    pastDeadline();
  }
  if (expired) {
    return false;
  }

  // most constrained table first
  int tableNo = -1;
  size_t fewest = 0;
  for (size_t t = 0; t != tables.size(); ++t) {
    if (solved[t]) {
      continue;
    }
    const size_t size = searchSpace[t]->size();
    if (tableNo < 0 || size < fewest) {
      tableNo = static_cast<int>(t);
      fewest = size;
    }
  }
  if (tableNo < 0) {
    solution = assignment;
    return true;
  }
  solved[tableNo] = true;

  const TableConstraint &table = tables[tableNo];
  size_t tried = 0;
  for (int i : *searchSpace[tableNo]) {
    if (++tried % 4096 == 0 && pastDeadline()) {
      return false;
    }
    const std::vector<int> &tuple = table.tuples[i];
    Assignment next(assignment);
    std::vector<int> changed;
    for (size_t k = 0; k != table.vars.size(); ++k) {
      const int var = table.vars[k];
      if (next[var] < 0) {
        next[var] = tuple[k];
        changed.push_back(var);
      }
    }
    if (!disjunctionsHold(next, changed)) {
      continue;
    }

    // returns null if any of the pruned tables are empty
    std::unique_ptr<SearchSpace> searchSpaceCopy(
        computeNewSearchSpaceGivenGuess(searchSpace, next, changed));
    if (!searchSpaceCopy) {
      if (expired) {
        return false;
      }
      continue;
    }

    if (solve(*searchSpaceCopy, next, solved)) {
      return true;
    }
    if (expired) {
      return false;
    }
  }
  return false;
}

SolveResult BacktrackingSolver::solve(const Model &model,
                                      double budgetSeconds) const {
  const Clock::time_point startTime = Clock::now();
  const Clock::time_point deadline =
      startTime + std::chrono::duration_cast<Clock::duration>(
                      std::chrono::duration<double>(budgetSeconds));

  SolveResult result;
  Search search(model, deadline);
  std::unique_ptr<SearchSpace> searchSpace = search.initialSearchSpace();
  if (!searchSpace) {
    result.status = SolveStatus::Infeasible;
    return result;
  }

  const Assignment empty(model.variables.size(), -1);
  const std::vector<bool> solved(searchSpace->size(), false);
  if (search.solve(*searchSpace, empty, solved)) {
    result.status = SolveStatus::Feasible;
    result.values = search.getSolution();
  } else if (search.timedOut()) {
    result.status = SolveStatus::Timeout;
  } else {
    result.status = SolveStatus::Infeasible;
  }
  result.numCalls = search.getNumCalls();

  if (verbosity >= 2) {
    const std::chrono::duration<double> elapsed = Clock::now() - startTime;
    std::cerr << "solver: " << solveStatusName(result.status) << " after "
              << result.numCalls << " calls, " << elapsed.count()
              << " seconds" << std::endl;
  }
  return result;
}
