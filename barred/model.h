#pragma once

#include "grid.h"
#include "index.h"
#include "layout.h"

#include <string>
#include <vector>

/* A solver-agnostic constraint model over the letters of a partly filled grid.
 *
 * Every free cell of an unresolved slot is one integer variable over the
 * alphabet (A..Z as 0..25); cells that already hold a letter become
 * constants. Letters are encoded the same way everywhere: letter - 'A'. */

// a cell of a slot: a variable (var >= 0) or the constant value
struct Term {
  int var = -1;
  int value = 0;

  bool isVariable() const { return var >= 0; }
};

struct Variable {
  std::string name;
  Position cell;
  int lo = 0;
  int hi = 25;
};

// the variables in vars must jointly take one of tuples
struct TableConstraint {
  std::vector<int> vars;
  std::vector<std::vector<int>> tuples;
};

struct Inequality {
  Term lhs;
  Term rhs;
};

// at least one of anyOf must hold
struct DisjunctionConstraint {
  std::vector<Inequality> anyOf;
};

struct ModelSlot {
  SlotSignature signature;
  std::vector<Term> terms; // one per cell
  Position clueBox;
  size_t candidateCount = 0;
};

struct Model {
  std::vector<Variable> variables;
  std::vector<TableConstraint> tables;
  std::vector<DisjunctionConstraint> disjunctions;
  std::vector<ModelSlot> slots;

  // the letters of slot under values
  std::string wordFor(const ModelSlot &slot,
                      const std::vector<int> &values) const;
};

struct BuildConfig {
  size_t maxCandidates = 8000;
  double fallbackFraction = 0.0;
  // candidates at or above the ceiling are dropped, unless that would empty
  // the slot; at most mediumSlotLimit slots may keep their full pool
  bool hasDifficultyCeiling = false;
  double maxDifficultyScore = 1.0;
  int mediumSlotLimit = -1; // -1: no slot may fall back
  int verbosity = 1;
};

class ModelBuilder {
public:
  ModelBuilder(const CandidateIndex &index_, const BuildConfig &config_)
      : index(index_), config(config_) {}

  /* Build the model for slots on grid.
   *
   * Every slot must already have a clue box among its offsets; usedWords are
   * the words committed so far, which no slot may repeat. Returns false
   * with a reason when the model is provably infeasible (a slot has no
   * candidates, too many slots need the difficulty fallback, or two slots
   * are already fixed to the same word). */
  bool build(const Grid &grid, const std::vector<SlotSignature> &slots,
             const WordSet &usedWords, Model &out, std::string &reason) const;

private:
  std::vector<std::string> candidatesFor(const Pattern &pattern,
                                         const WordSet &usedWords,
                                         int &mediumSlots) const;

  const CandidateIndex &index;
  BuildConfig config;
};

// every pair of letters consistent with the fixed letters of pattern
std::vector<std::string> twoLetterCandidates(const Pattern &pattern);

/* Write a solved assignment back, one committed slot per model slot, through
 * engine. Stops at the first slot the grid refuses. */
bool commitAssignment(LayoutEngine &engine, const Model &model,
                      const std::vector<int> &values, std::string &reason);
