#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

/* everything in this project is addressed as (row, col) */

enum class CellType { Empty, Letter, ClueBox, BlockerZone };
enum class Direction : char { Across = 'a', Down = 'd' };

const char *cellTypeName(CellType type);
const char *directionName(Direction direction);

struct Position {
  int row;
  int col;
};

inline bool operator==(const Position &a, const Position &b) {
  return a.row == b.row && a.col == b.col;
}
inline bool operator!=(const Position &a, const Position &b) {
  return !(a == b);
}
inline bool operator<(const Position &a, const Position &b) {
  return a.row != b.row ? a.row < b.row : a.col < b.col;
}

// one (row, col) step along direction
inline Position step(Direction direction) {
  return direction == Direction::Across ? Position{0, 1} : Position{1, 0};
}

/* Extent represents a range [min, max]
 *
 * Intent is that extent reflects [min, max], i.e, min represents the
 * first cell of the run and max represents the last, so loop from
 * min <= index <= max */
class Extent {
public:
  Extent() : min(-1), max(-1) {}
  Extent(int min_, int max_) : min(min_), max(max_) {}
  int length() const { return max - min + 1; }
  int min;
  int max;
};

// a clue record hosted inside a clue box; offset is start minus clue box
struct Clue {
  std::string id;
  std::string text;
  std::string slotId;
  int length = 0;
  Direction direction = Direction::Across;
  int offsetRow = 0;
  int offsetCol = 0;
};

bool operator==(const Clue &a, const Clue &b);

struct Cell {
  CellType type = CellType::Empty;
  char letter = 0; // non-zero iff type == Letter
  std::set<std::string> slotIds;
  std::vector<Clue> clues;

  bool isPlayable() const {
    return type == CellType::Empty || type == CellType::Letter;
  }
  bool isBlocked() const {
    return type == CellType::ClueBox || type == CellType::BlockerZone;
  }
};

bool operator==(const Cell &a, const Cell &b);
inline bool operator!=(const Cell &a, const Cell &b) { return !(a == b); }

/* A committed (or about to be committed) word.
 *
 * The cell coordinates are a pure function of start, direction and length;
 * they are computed on first use and cached, never edited. */
class WordSlot {
public:
  WordSlot() = default;
  WordSlot(const std::string &id_, int row_, int col_, Direction direction_,
           int length_, Position clueBox_, bool isTheme_ = false)
      : id(id_), row(row_), col(col_), direction(direction_),
        length(length_), clueBox(clueBox_), isTheme(isTheme_) {}

  const std::vector<Position> &cells() const;

  std::string id;
  int row = 0;
  int col = 0;
  Direction direction = Direction::Across;
  int length = 0;
  Position clueBox{-1, -1};
  std::string text; // empty until committed
  bool isTheme = false;

private:
  mutable std::vector<Position> cachedCells;
};

struct BlockerZone {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

struct GridConfig {
  int rows = 0;
  int cols = 0;
  int minBlockerSize = 3;
  int maxBlockerSize = 6;
  bool placeBlockerZone = true;
  // when set the blocker zone is exactly blockerOverride
  bool hasBlockerOverride = false;
  BlockerZone blockerOverride;
  // barred grids conventionally open with a clue box in the corner
  bool plantTopLeftClue = false;
  uint32_t seed = 0;
};

/* A stack of reversal closures.
 *
 * Every committing grid operation can record how to undo itself here;
 * rollback() replays them newest first, commit() forgets them. */
class UndoStack {
public:
  void push(std::function<void()> undo) { undos.push_back(std::move(undo)); }
  void rollback();
  void commit() { undos.clear(); }
  bool empty() const { return undos.empty(); }
  size_t size() const { return undos.size(); }

private:
  std::vector<std::function<void()>> undos;
};

class Grid {
public:
  explicit Grid(const GridConfig &config_);

  // undo closures stay bound to the grid that recorded them, never a copy
  Grid(const Grid &) = default;
  Grid &operator=(const Grid &) = default;

  int getNumRows() const { return rows; }
  int getNumCols() const { return cols; }
  const GridConfig &getConfig() const { return config; }

  bool contains(int row, int col) const {
    return row >= 0 && row < rows && col >= 0 && col < cols;
  }
  Cell &operator()(int row, int col) { return cells[row * cols + col]; }
  const Cell &operator()(int row, int col) const {
    return cells[row * cols + col];
  }

  int getPlayableCount() const { return playableCount; }
  int getFilledCount() const { return filledCount; }
  double filledRatio() const {
    return playableCount ? double(filledCount) / playableCount : 0.0;
  }

  const BlockerZone *getBlockerZone() const {
    return hasBlocker ? &blocker : nullptr;
  }

  using Licenses = std::map<Position, std::set<std::string>>;
  const Licenses &getLicenses() const { return licenses; }
  const std::map<std::string, WordSlot> &getWordSlots() const {
    return wordSlots;
  }
  WordSlot *findSlot(const std::string &id);

  std::mt19937 &getRng() { return rng; }

  /***** blocker zone *****/

  // pick an anchor and size and carve the zone; no-op if one exists
  void placeBlockerZone();
  void setBlockerCell(int row, int col);

  /***** clue boxes *****/

  // the offsets (relative to a slot start) where its clue box may sit
  static const std::array<Position, 3> &clueOffsets(Direction direction);

  // adjacency, corner and isolation rules for turning (row, col) into a clue
  bool canPlaceClueBox(int row, int col) const;
  bool addClueBox(int row, int col, std::string *reason = nullptr,
                  UndoStack *undo = nullptr);

  // least-licensed existing clue box at one of the start's offsets
  bool findClueForStart(int row, int col, Direction direction,
                        Position &out) const;
  // like findClueForStart, but creates a clue box when none exists
  bool ensureClueBox(int row, int col, Direction direction, Position &out,
                     UndoStack *undo = nullptr);

  // could a clue box for this start exist (already, or by creating one)?
  bool startHasClueCapacity(int row, int col, Direction direction) const;

  // re-point a committed slot at another clue box, moving its hosted clues
  void moveSlotToClue(const std::string &slotId, Position newClue);

  void hostClue(Position clueBox, const Clue &clue);
  void clearHostedClues();

  /***** words *****/

  // checkWord says if it is possible to place a word in the current grid
  // at the specified location (it checks to see if it conflicts with
  // the letters that are already in the grid)
  bool checkWord(const std::string &word, int row, int col,
                 Direction direction) const;

  // all-or-nothing: on failure nothing is mutated
  bool placeWord(const WordSlot &slot, const std::string &text,
                 std::string *reason = nullptr, UndoStack *undo = nullptr);
  void removeWord(const std::string &slotId);

  // placeWord that hands back its reversal closure, or an empty function if
  // nothing was placed; calling the closure restores the prior cells exactly
  std::function<void()> placeWordUndoable(const WordSlot &slot,
                                          const std::string &text,
                                          std::string *reason = nullptr);

  // the cell after a freshly placed word must end the run; see grid.cpp.
  // On success *nextStart (if given) is set to a new open start, or {-1,-1}
  bool ensureTerminalBoundary(const WordSlot &slot, Position *nextStart,
                              std::string *reason = nullptr,
                              UndoStack *undo = nullptr);

  /***** runs *****/

  // does a slot starting at (row, col) in this direction have room for at
  // least two cells?
  bool hasCapacityForStart(int row, int col, Direction direction) const;

  // no playable predecessor in this direction
  bool isBoundary(int row, int col, Direction direction) const;

  // given a cell in the grid and a direction, how far does the playable run
  // through that cell extend?
  Extent findExtent(int row, int col, Direction direction) const;

  bool hasPlayableNeighbor(int row, int col) const;

  // cell-by-cell and bookkeeping equality, used to check undo round trips
  bool sameState(const Grid &other) const;

  friend std::ostream &operator<<(std::ostream &os, const Grid &grid);

private:
  void convertToClueBox(int row, int col, UndoStack *undo);

  GridConfig config;
  int rows, cols;
  std::vector<Cell> cells; // actually stores the grid data
  std::map<std::string, WordSlot> wordSlots;
  Licenses licenses;
  bool hasBlocker;
  BlockerZone blocker;
  int playableCount;
  int filledCount;
  std::mt19937 rng;
};

char cellSymbol(const Cell &cell);
