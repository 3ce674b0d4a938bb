#include "generator.h"

#include <algorithm>
#include <chrono>
#include <cilk/cilk.h>
#include <map>

GridConfig GeneratorConfig::toGridConfig(uint32_t gridSeed) const {
  GridConfig grid;
  grid.rows = rows;
  grid.cols = cols;
  grid.minBlockerSize = minBlockerSize;
  grid.maxBlockerSize = maxBlockerSize;
  grid.placeBlockerZone = placeBlockerZone || hasBlockerOverride;
  grid.hasBlockerOverride = hasBlockerOverride;
  grid.blockerOverride = blockerOverride;
  grid.plantTopLeftClue = true;
  grid.seed = gridSeed;
  return grid;
}

IndexConfig GeneratorConfig::toIndexConfig() const {
  IndexConfig index;
  index.maxLength = std::max(rows, cols);
  index.difficulty = difficulty;
  return index;
}

LayoutConfig GeneratorConfig::toLayoutConfig() const {
  LayoutConfig layout;
  layout.minThemeCoverage = minThemeCoverage;
  layout.maxThemeRatio = maxThemeRatio;
  layout.themePlacementAttempts = themePlacementAttempts;
  layout.verbosity = verbosity;
  return layout;
}

BuildConfig GeneratorConfig::toBuildConfig() const {
  BuildConfig build;
  build.maxCandidates = maxCandidates;
  build.fallbackFraction = fallbackFraction;
  build.hasDifficultyCeiling = hasDifficultyCeiling;
  build.maxDifficultyScore = maxDifficultyScore;
  build.mediumSlotLimit = mediumSlotLimit;
  build.verbosity = verbosity;
  return build;
}

int GeneratorConfig::annealTrials() const {
  return std::max(3, std::min(8, retryLimit * 2));
}

size_t GeneratorConfig::themeRequestTarget() const {
  // sized from the whole grid; the blocker zone only makes this generous
  const int minLetters =
      std::max(1, static_cast<int>(rows * cols * minThemeCoverage));
  const size_t estimatedWords = static_cast<size_t>(minLetters / 5 + 2);
  return std::max(themeRequestSize, estimatedWords * 3);
}

const char *attemptStatusName(AttemptStatus status) {
  switch (status) {
  case AttemptStatus::Ok:
    return "OK";
  case AttemptStatus::Fatal:
    return "FATAL";
  case AttemptStatus::Retry:
    break;
  }
  return "RETRY";
}

Generator::Generator(const CandidateIndex &index_,
                     const GeneratorConfig &config_,
                     ThemeWordProvider *themeProvider_,
                     ClueTextProvider *clueProvider_,
                     const ConstraintSolver *solver_)
    : index(index_), config(config_), themeProvider(themeProvider_),
      builtinThemes(config_.seed), clueProvider(clueProvider_),
      solver(solver_), backtrackingSolver(config_.verbosity) {
  if (!clueProvider) {
    clueProvider = &templateClues;
  }
  if (!solver) {
    solver = &backtrackingSolver;
  }
}

std::vector<ThemeWord> Generator::fetchThemeWords() {
  builtinThemes.reseed(config.seed);
  std::vector<ThemeWordProvider *> fallbacks(1, &builtinThemes);
  std::vector<ThemeWord> words = mergeThemeProviders(
      themeProvider, fallbacks, config.theme, config.themeRequestTarget(),
      config.difficulty, config.language);
  if (config.verbosity >= 1) {
    std::cout << "theme '" << config.theme << "': " << words.size()
              << " candidate words" << std::endl;
  }
  return words;
}

void Generator::annealLayout(Grid &grid, std::mt19937 &rng) const {
  // only a randomly placed blocker zone gives the trials anything to vary
  if (!config.placeBlockerZone || config.hasBlockerOverride) {
    return;
  }
  double bestScore = scoreLayout(grid);
  for (int i = 0; i < config.annealTrials(); ++i) {
    GridConfig trialConfig = grid.getConfig();
    trialConfig.seed = rng();
    Grid trial(trialConfig);
    const double score = scoreLayout(trial);
    if (score > bestScore) {
      bestScore = score;
      grid = trial;
    }
  }
}

bool Generator::fill(LayoutEngine &engine, std::string &reason) const {
  Grid &grid = engine.getGrid();

  // runs the layout already completed become slots as they stand
  for (const SlotSignature &signature : engine.openSlots()) {
    const Pattern pattern = engine.signaturePattern(signature);
    if (pattern.find('.') != std::string::npos) {
      continue;
    }
    if (engine.getUsedWords().count(pattern)) {
      reason = "prefilled run repeats " + pattern;
      return false;
    }
    if (!engine.commitSignature(signature, pattern, reason)) {
      return false;
    }
  }

  const std::vector<SlotSignature> open = engine.openSlots();
  if (open.empty()) {
    return true;
  }

  ModelBuilder builder(index, config.toBuildConfig());
  Model model;
  if (!builder.build(grid, open, engine.getUsedWords(), model, reason)) {
    return false;
  }
  const SolveResult solved = solver->solve(model, config.fillTimeoutSeconds);
  if (solved.status != SolveStatus::Feasible) {
    reason = std::string("solver returned ") +
             solveStatusName(solved.status) + " for " +
             std::to_string(open.size()) + " slots";
    return false;
  }
  return commitAssignment(engine, model, solved.values, reason);
}

AttemptResult Generator::runAttempt(uint32_t seed,
                                    const std::vector<ThemeWord> &words,
                                    int attempt) const {
  AttemptResult result;
  result.attempt = attempt;
  result.seed = seed;
  if (words.empty()) {
    result.status = AttemptStatus::Fatal;
    result.reason = "no theme words available";
    return result;
  }

  std::mt19937 rng(seed);
  std::shared_ptr<Grid> grid =
      std::make_shared<Grid>(config.toGridConfig(rng()));
  annealLayout(*grid, rng);

  LayoutEngine engine(*grid, index, config.toLayoutConfig(), rng());
  if (!engine.seedThemeWords(words, result.placedThemeWords, result.reason)) {
    return result;
  }
  if (!engine.completeLayout(result.reason)) {
    return result;
  }
  if (!fill(engine, result.reason)) {
    return result;
  }
  engine.repairOrphanClues();

  GridValidator validator(index);
  result.validation = validator.validate(*grid, engine.getThemeSurfaces());
  if (!result.validation.ok) {
    result.reason = "validation failed: " + result.validation.messages.front();
    return result;
  }

  result.status = AttemptStatus::Ok;
  result.grid = grid;
  result.themeSurfaces = engine.getThemeSurfaces();
  return result;
}

CrosswordResult Generator::finish(const AttemptResult &attempt) {
  CrosswordResult result;
  result.ok = true;
  result.grid = attempt.grid;
  result.themeWords = attempt.placedThemeWords;
  result.validationMessages = attempt.validation.messages;
  result.seed = config.seed;
  result.attempt = attempt.attempt;

  Grid &grid = *result.grid;
  attachClues(grid, clueProvider->generate(clueRequestsFor(grid)));
  for (const auto &kv : grid.getWordSlots()) {
    result.slots.push_back(kv.second);
  }
  if (config.verbosity >= 1) {
    std::cout << "crossword generation completed with " << result.slots.size()
              << " words on attempt " << result.attempt << std::endl;
  }
  return result;
}

CrosswordResult Generator::generate() {
  CrosswordResult failure;
  failure.seed = config.seed;
  if (config.rows < 3 || config.cols < 3) {
    failure.reason = "grid must be at least 3x3";
    return failure;
  }

  const std::vector<ThemeWord> words = fetchThemeWords();
  if (words.empty()) {
    failure.reason = "no theme words available";
    return failure;
  }

  std::mt19937 master(config.seed);
  std::vector<uint32_t> seeds(std::max(0, config.retryLimit));
  for (uint32_t &seed : seeds) {
    seed = master();
  }

  const int total = static_cast<int>(seeds.size());
  const int batch = std::max(1, config.concurrentAttempts);
  for (int first = 0; first < total; first += batch) {
    const int n = std::min(batch, total - first);
    std::vector<AttemptResult> results(n);
    cilk_for (int i = 0; i < n; ++i) {
      results[i] = runAttempt(seeds[first + i], words, first + i + 1);
    }

    for (const AttemptResult &result : results) {
      switch (result.status) {
      case AttemptStatus::Ok:
        return finish(result);
      case AttemptStatus::Fatal:
        std::cerr << "attempt " << result.attempt << " failed: "
                  << result.reason << std::endl;
        failure.reason = result.reason;
        return failure;
      case AttemptStatus::Retry:
        if (config.verbosity >= 1) {
          std::cerr << "attempt " << result.attempt << "/" << total
                    << " failed: " << result.reason << std::endl;
        }
        break;
      }
    }
  }

  failure.reason = "unable to generate crossword after " +
                   std::to_string(total) + " attempts";
  return failure;
}

void printStats(std::ostream &os, const Grid &grid) {
  int clueBoxes = 0;
  int blockers = 0;
  for (int r = 0; r < grid.getNumRows(); ++r) {
    for (int c = 0; c < grid.getNumCols(); ++c) {
      switch (grid(r, c).type) {
      case CellType::ClueBox:
        ++clueBoxes;
        break;
      case CellType::BlockerZone:
        ++blockers;
        break;
      case CellType::Empty:
      case CellType::Letter:
        break;
      }
    }
  }

  std::map<int, int> lengths;
  int across = 0;
  int down = 0;
  int theme = 0;
  for (const auto &kv : grid.getWordSlots()) {
    const WordSlot &slot = kv.second;
    ++lengths[slot.length];
    if (slot.direction == Direction::Across) {
      ++across;
    } else {
      ++down;
    }
    if (slot.isTheme) {
      ++theme;
    }
  }

  os << "Grid " << grid.getNumRows() << "x" << grid.getNumCols() << ": "
     << grid.getPlayableCount() << " playable, " << grid.getFilledCount()
     << " filled, " << clueBoxes << " clue boxes, " << blockers
     << " blocker cells" << std::endl;
  os << "Words: " << grid.getWordSlots().size() << " (" << across
     << " across, " << down << " down, " << theme << " theme)" << std::endl;
  for (const auto &kv : lengths) {
    os << "  length " << kv.first << ": " << kv.second << std::endl;
  }
}
