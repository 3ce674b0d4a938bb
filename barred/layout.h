#pragma once

#include "grid.h"
#include "index.h"
#include "theme.h"

#include <queue>
#include <random>
#include <string>
#include <vector>

/* A run of playable cells as it stands right now. Signatures are recomputed
 * whenever they're needed and never stored across grid mutations. */
struct SlotSignature {
  int row = 0;
  int col = 0;
  Direction direction = Direction::Across;
  std::vector<Position> cells;

  int length() const { return static_cast<int>(cells.size()); }
};

struct LayoutConfig {
  // theme letters must cover at least this fraction of playable cells
  double minThemeCoverage = 0.10;
  // and stop being placed once they cover this fraction
  double maxThemeRatio = 0.4;
  // random start attempts per theme word once pending starts are exhausted
  int themePlacementAttempts = 30;
  // a 3-letter crossing needs at least this many candidates
  size_t minThreeLetterCandidates = 3;
  // runs longer than these are split, coarse pass first
  std::vector<int> partitionThresholds = {10, 8};
  int partitionIterations = 30;
  int completionRounds = 5;
  int verbosity = 1;
};

/* Per-attempt layout state and the algorithms that shape the grid.
 *
 * A LayoutEngine is created for exactly one Grid and one attempt and owns
 * all of that attempt's bookkeeping (slot counter, occupied slot keys,
 * placement history, used words, pending starts). Nothing here is shared
 * with other attempts; the index is only read. */
class LayoutEngine {
public:
  LayoutEngine(Grid &grid_, const CandidateIndex &index_,
               const LayoutConfig &config_, uint32_t seed);

  Grid &getGrid() { return grid; }
  const Grid &getGrid() const { return grid; }

  const WordSet &getUsedWords() const { return usedWords; }
  const WordSet &getThemeSurfaces() const { return themeSurfaces; }
  const std::vector<std::string> &getPlacementHistory() const {
    return placementHistory;
  }
  size_t pendingStartCount() const { return pending.size(); }

  /***** run detection *****/

  // the maximal playable run through (row, col); false if shorter than 2
  bool buildSignature(int row, int col, Direction direction,
                      SlotSignature &out) const;
  Pattern signaturePattern(const SlotSignature &signature) const;
  bool isOccupied(const SlotSignature &signature) const;

  // every run of length >= 2 that isn't a committed slot yet
  std::vector<SlotSignature> openSlots() const;

  /***** theme placement *****/

  // place theme words until the letter budget is reached; false (with
  // reason) if the placed letters don't reach the coverage minimum
  bool seedThemeWords(const std::vector<ThemeWord> &words,
                      std::vector<ThemeWord> &placed, std::string &reason);

  // pending starts first, then random boundary starts
  bool placeSpecificWord(const std::string &word, const ThemeWord *theme,
                         bool isTheme);

  // one fully checked placement; rolls itself back on any failure
  bool placeWordAt(const std::string &word, const ThemeWord *theme,
                   bool isTheme, Direction direction, int row, int col);

  // boundary starts whose next length cells are all unblocked
  std::vector<Position> candidateStarts(int length,
                                        Direction direction) const;

  void queueStart(Position start, Direction direction);

  /***** layout completion *****/

  // heal, partition, license, repair orphans, verify; repeated until the
  // verification pass stops changing the layout
  bool completeLayout(std::string &reason);

  bool healIsolatedCells(std::string &reason);
  bool partitionLongRuns(int maxLength);
  bool ensureAllLicensed(std::string &reason);
  bool repairOrphanClues();
  bool verifyFeasibility(std::string &reason, bool &repaired);

  /***** commits from the fill *****/

  // commit word into an open run using the run's existing clue box
  bool commitSignature(const SlotSignature &signature,
                       const std::string &word, std::string &reason);

private:
  struct PendingStart {
    double priority;
    int order;
    Position start;
    Direction direction;
  };
  struct PendingAfter {
    bool operator()(const PendingStart &a, const PendingStart &b) const {
      if (a.priority != b.priority) {
        return a.priority > b.priority;
      }
      return a.order > b.order;
    }
  };

  bool attemptPendingStart(const std::string &word, const ThemeWord *theme,
                           bool isTheme);
  bool validateCrossings(const WordSlot &slot, std::string &reason) const;
  bool slotOverlapsBlock(int row, int col, Direction direction,
                         int length) const;
  bool tryPartitionInfeasible(const SlotSignature &signature);
  bool assignExistingSlotToClue(Position cluePos);
  void attachThemeClue(const WordSlot &slot, const ThemeWord &theme);

  std::string nextSlotId(Direction direction) const;
  void registerSlot(const WordSlot &slot);
  bool isValidComplete(const std::string &surface) const;

  bool debug() const { return config.verbosity >= 2; }

  Grid &grid;
  const CandidateIndex &index;
  LayoutConfig config;
  std::mt19937 rng;

  int slotCounter;
  std::set<std::string> occupiedSlots;
  std::vector<std::string> placementHistory;
  WordSet usedWords;
  WordSet themeSurfaces;
  std::priority_queue<PendingStart, std::vector<PendingStart>, PendingAfter>
      pending;
  int pendingCounter;
};

// the signature key of a slot: row:col:direction:length
std::string slotKey(int row, int col, Direction direction, int length);

// playable cells minus penalties for orphan and touching clue boxes and
// for a lopsided blocker zone; used to pick among trial layouts
double scoreLayout(const Grid &grid);
