#include <catch2/catch_test_macros.hpp>

#include "solver.h"

#include <chrono>

namespace {

Model freeVariables(int count) {
  Model model;
  for (int v = 0; v < count; ++v) {
    Variable variable;
    variable.name = "v" + std::to_string(v);
    variable.cell = Position{0, v};
    model.variables.push_back(variable);
  }
  return model;
}

Term var(int v) { return Term{v, 0}; }
Term constant(int value) { return Term{-1, value}; }

DisjunctionConstraint differs(Term lhs, Term rhs) {
  DisjunctionConstraint constraint;
  constraint.anyOf.push_back(Inequality{lhs, rhs});
  return constraint;
}

} // namespace

TEST_CASE("an empty model is trivially feasible", "[solver]") {
  const SolveResult result = BacktrackingSolver(0).solve(Model(), 1.0);
  REQUIRE(result.status == SolveStatus::Feasible);
  REQUIRE(result.values.empty());
}

TEST_CASE("tables and disjunctions together", "[solver]") {
  Model model = freeVariables(2);
  model.tables.push_back(TableConstraint{{0}, {{0}, {1}}});
  model.tables.push_back(TableConstraint{{1}, {{0}, {1}}});
  // x != y, and x != 0
  model.disjunctions.push_back(differs(var(0), var(1)));
  model.disjunctions.push_back(differs(var(0), constant(0)));

  const SolveResult result = BacktrackingSolver(0).solve(model, 10.0);
  REQUIRE(result.status == SolveStatus::Feasible);
  REQUIRE(result.values == std::vector<int>{1, 0});
  REQUIRE(result.numCalls > 0);
}

TEST_CASE("a variable with no table ranges over its bounds", "[solver]") {
  Model model = freeVariables(1);
  model.disjunctions.push_back(differs(var(0), constant(0)));
  const SolveResult result = BacktrackingSolver(0).solve(model, 10.0);
  REQUIRE(result.status == SolveStatus::Feasible);
  REQUIRE(result.values == std::vector<int>{1});
}

TEST_CASE("contradictions are infeasible", "[solver]") {
  SECTION("the only tuple is forbidden") {
    Model model = freeVariables(1);
    model.tables.push_back(TableConstraint{{0}, {{4}}});
    model.disjunctions.push_back(
        differs(var(0), constant(4)));
    REQUIRE(BacktrackingSolver(0).solve(model, 10.0).status ==
            SolveStatus::Infeasible);
  }

  SECTION("a table without tuples") {
    Model model = freeVariables(1);
    model.tables.push_back(TableConstraint{{0}, {}});
    REQUIRE(BacktrackingSolver(0).solve(model, 10.0).status ==
            SolveStatus::Infeasible);
  }

  SECTION("tables that disagree on a shared variable") {
    Model model = freeVariables(2);
    model.tables.push_back(TableConstraint{{0, 1}, {{0, 1}, {1, 2}}});
    model.tables.push_back(TableConstraint{{1}, {{3}}});
    REQUIRE(BacktrackingSolver(0).solve(model, 10.0).status ==
            SolveStatus::Infeasible);
  }
}

TEST_CASE("an exhausted budget reports a timeout", "[solver]") {
  Model model = freeVariables(3);
  model.tables.push_back(TableConstraint{{0, 1, 2}, {{0, 1, 2}, {2, 1, 0}}});
  const SolveResult result = BacktrackingSolver(0).solve(model, -1.0);
  REQUIRE(result.status == SolveStatus::Timeout);
  REQUIRE(result.values.empty());
  REQUIRE(std::string(solveStatusName(result.status)) == "TIMEOUT");
}

TEST_CASE("a search that cannot finish stops near its budget", "[solver]") {
  // 27 pairwise distinct letters: infeasible, but only after trying
  // far more assignments than fit in the budget
  const int count = 27;
  Model model = freeVariables(count);
  TableConstraint quads;
  quads.vars = {0, 1, 2, 3};
  for (int a = 0; a < 26; ++a) {
    for (int b = 0; b < 26; ++b) {
      for (int c = 0; c < 26; ++c) {
        for (int d = 0; d < 26; ++d) {
          quads.tuples.push_back(std::vector<int>{a, b, c, d});
        }
      }
    }
  }
  model.tables.push_back(quads);
  for (int i = 0; i < count; ++i) {
    for (int j = i + 1; j < count; ++j) {
      model.disjunctions.push_back(differs(var(i), var(j)));
    }
  }

  const auto start = std::chrono::steady_clock::now();
  const SolveResult result = BacktrackingSolver(0).solve(model, 0.2);
  const std::chrono::duration<double> elapsed =
      std::chrono::steady_clock::now() - start;
  REQUIRE(result.status == SolveStatus::Timeout);
  REQUIRE(elapsed.count() < 3.0);
}
