#pragma once

#include "clues.h"
#include "grid.h"
#include "index.h"
#include "layout.h"
#include "model.h"
#include "solver.h"
#include "theme.h"
#include "validator.h"

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

struct GeneratorConfig {
  int rows = 12;
  int cols = 12;
  std::string theme = "natura";
  Difficulty difficulty = Difficulty::Medium;
  std::string language = "Romanian";
  uint32_t seed = 0;

  // attempts in total, and how many of them run at once
  int retryLimit = 3;
  int concurrentAttempts = 1;

  double minThemeCoverage = 0.10;
  double maxThemeRatio = 0.4;
  size_t themeRequestSize = 80;
  int themePlacementAttempts = 30;
  double fillTimeoutSeconds = 30.0;

  bool placeBlockerZone = true;
  bool hasBlockerOverride = false;
  BlockerZone blockerOverride;
  int minBlockerSize = 3;
  int maxBlockerSize = 6;

  size_t maxCandidates = 8000;
  double fallbackFraction = 0.0;
  bool hasDifficultyCeiling = false;
  double maxDifficultyScore = 1.0;
  int mediumSlotLimit = -1;

  int verbosity = 1;

  GridConfig toGridConfig(uint32_t gridSeed) const;
  IndexConfig toIndexConfig() const;
  LayoutConfig toLayoutConfig() const;
  BuildConfig toBuildConfig() const;

  // how many trial blocker layouts the annealing step scores
  int annealTrials() const;
  // how many theme words to ask the providers for
  size_t themeRequestTarget() const;
};

enum class AttemptStatus { Ok, Retry, Fatal };

const char *attemptStatusName(AttemptStatus status);

struct AttemptResult {
  AttemptStatus status = AttemptStatus::Retry;
  std::string reason;
  int attempt = 0;
  uint32_t seed = 0;
  std::shared_ptr<Grid> grid; // set when Ok
  std::vector<ThemeWord> placedThemeWords;
  WordSet themeSurfaces;
  ValidationResult validation;
};

struct CrosswordResult {
  bool ok = false;
  std::string reason;
  std::shared_ptr<Grid> grid;
  std::vector<WordSlot> slots;
  std::vector<ThemeWord> themeWords;
  std::vector<std::string> validationMessages;
  uint32_t seed = 0;
  int attempt = 0;
};

/* Runs generation attempts until one succeeds or the retry limit is hit.
 *
 * Attempt seeds are drawn up front from the configured seed, and attempts
 * are started in batches of concurrentAttempts with cilk_for. Each attempt
 * builds its own Grid and LayoutEngine; only the index, the solver and the
 * fetched theme words are shared, all read-only. Results are inspected in
 * attempt order, so the first successful attempt wins no matter how many
 * ran in parallel and the output depends only on the seed. */
class Generator {
public:
  Generator(const CandidateIndex &index_, const GeneratorConfig &config_,
            ThemeWordProvider *themeProvider_ = nullptr,
            ClueTextProvider *clueProvider_ = nullptr,
            const ConstraintSolver *solver_ = nullptr);

  // the provider and solver pointers may point into this object
  Generator(const Generator &) = delete;
  Generator &operator=(const Generator &) = delete;

  CrosswordResult generate();

  // primary provider first, then the built-in buckets
  std::vector<ThemeWord> fetchThemeWords();

  // one complete attempt: layout, theme placement, completion, fill,
  // validation. Never touches state shared with other attempts.
  AttemptResult runAttempt(uint32_t seed, const std::vector<ThemeWord> &words,
                           int attempt) const;

  const GeneratorConfig &getConfig() const { return config; }

private:
  void annealLayout(Grid &grid, std::mt19937 &rng) const;
  bool fill(LayoutEngine &engine, std::string &reason) const;
  CrosswordResult finish(const AttemptResult &attempt);

  const CandidateIndex &index;
  GeneratorConfig config;
  ThemeWordProvider *themeProvider;
  BuiltinThemeProvider builtinThemes;
  ClueTextProvider *clueProvider;
  TemplateClueProvider templateClues;
  const ConstraintSolver *solver;
  BacktrackingSolver backtrackingSolver;
};

// grid geometry counts and a histogram of word lengths
void printStats(std::ostream &os, const Grid &grid);
