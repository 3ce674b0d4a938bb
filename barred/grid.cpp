#include "grid.h"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

// empty cell: printed as '.'
// clue box: printed as '#'
// blocker zone: printed as 'X'

namespace {

const Position orthogonalSteps[4] = {{0, 1}, {1, 0}, {0, -1}, {-1, 0}};

void setReason(std::string *reason, const std::string &text) {
  if (reason) {
    *reason = text;
  }
}

std::string at(int row, int col) {
  return "(" + std::to_string(row) + "," + std::to_string(col) + ")";
}

} // namespace

const char *cellTypeName(CellType type) {
  switch (type) {
  case CellType::Empty:
    return "EMPTY_PLAYABLE";
  case CellType::Letter:
    return "LETTER";
  case CellType::ClueBox:
    return "CLUE_BOX";
  case CellType::BlockerZone:
    return "BLOCKER_ZONE";
  }
  return "?";
}

const char *directionName(Direction direction) {
  return direction == Direction::Across ? "ACROSS" : "DOWN";
}

bool operator==(const Clue &a, const Clue &b) {
  return a.id == b.id && a.text == b.text && a.slotId == b.slotId &&
         a.length == b.length && a.direction == b.direction &&
         a.offsetRow == b.offsetRow && a.offsetCol == b.offsetCol;
}

bool operator==(const Cell &a, const Cell &b) {
  return a.type == b.type && a.letter == b.letter && a.slotIds == b.slotIds &&
         a.clues == b.clues;
}

char cellSymbol(const Cell &cell) {
  switch (cell.type) {
  case CellType::Letter:
    return cell.letter ? cell.letter : '?';
  case CellType::ClueBox:
    return '#';
  case CellType::BlockerZone:
    return 'X';
  case CellType::Empty:
    break;
  }
  return '.';
}

const std::vector<Position> &WordSlot::cells() const {
  if (static_cast<int>(cachedCells.size()) != length) {
    cachedCells.clear();
    const Position d = step(direction);
    for (int i = 0; i < length; ++i) {
      cachedCells.push_back(Position{row + d.row * i, col + d.col * i});
    }
  }
  return cachedCells;
}

void UndoStack::rollback() {
  while (!undos.empty()) {
    std::function<void()> undo = std::move(undos.back());
    undos.pop_back();
    undo();
  }
}

Grid::Grid(const GridConfig &config_)
    : config(config_), rows(config_.rows), cols(config_.cols),
      cells(config_.rows * config_.cols), hasBlocker(false),
      playableCount(config_.rows * config_.cols), filledCount(0),
      rng(config_.seed) {
  if (config.plantTopLeftClue) {
    // a grid too small for the corner clue simply starts without one
    addClueBox(0, 0);
  }
  if (config.placeBlockerZone) {
    placeBlockerZone();
  }
}

WordSlot *Grid::findSlot(const std::string &id) {
  auto it = wordSlots.find(id);
  return it == wordSlots.end() ? nullptr : &it->second;
}

/***** blocker zone *****/

void Grid::placeBlockerZone() {
  if (hasBlocker) {
    return;
  }

  BlockerZone zone;
  if (config.hasBlockerOverride) {
    zone = config.blockerOverride;
  } else {
    const int maxH = std::min(config.maxBlockerSize, std::max(3, rows / 2));
    const int maxW = std::min(config.maxBlockerSize, std::max(3, cols / 2));
    const int minH = std::min(config.minBlockerSize, maxH);
    const int minW = std::min(config.minBlockerSize, maxW);
    zone.height = std::uniform_int_distribution<int>(minH, maxH)(rng);
    zone.width = std::uniform_int_distribution<int>(minW, maxW)(rng);

    // four corners and the center
    const Position anchors[5] = {
        {0, 0},
        {0, cols - zone.width},
        {rows - zone.height, 0},
        {rows - zone.height, cols - zone.width},
        {(rows - zone.height) / 2, (cols - zone.width) / 2},
    };
    const Position anchor =
        anchors[std::uniform_int_distribution<int>(0, 4)(rng)];
    zone.row = std::max(0, anchor.row);
    zone.col = std::max(0, anchor.col);
  }

  for (int r = zone.row; r < std::min(zone.row + zone.height, rows); ++r) {
    for (int c = zone.col; c < std::min(zone.col + zone.width, cols); ++c) {
      if (contains(r, c)) {
        setBlockerCell(r, c);
      }
    }
  }
  blocker = zone;
  hasBlocker = true;

  if (zone.row == 0 && zone.col == 0) {
    // the playable area left over is an L; give both of its arms a clue box
    // at their re-entrant corner so the first placements have somewhere to
    // hang their clues. Either may legitimately be refused.
    if (zone.width < cols) {
      addClueBox(0, zone.width);
    }
    if (zone.height < rows) {
      addClueBox(zone.height, 0);
    }
  }
}

void Grid::setBlockerCell(int row, int col) {
  Cell &cell = (*this)(row, col);
  if (cell.isPlayable()) {
    --playableCount;
  }
  if (cell.type == CellType::Letter) {
    --filledCount;
  }
  cell.type = CellType::BlockerZone;
  cell.letter = 0;
  cell.slotIds.clear();
  cell.clues.clear();
  licenses.erase(Position{row, col});
}

/***** clue boxes *****/

const std::array<Position, 3> &Grid::clueOffsets(Direction direction) {
  static const std::array<Position, 3> across = {
      Position{0, -1}, Position{-1, 0}, Position{1, 0}};
  static const std::array<Position, 3> down = {
      Position{-1, 0}, Position{0, -1}, Position{0, 1}};
  return direction == Direction::Across ? across : down;
}

bool Grid::hasPlayableNeighbor(int row, int col) const {
  for (const Position &d : orthogonalSteps) {
    const int nr = row + d.row;
    const int nc = col + d.col;
    if (contains(nr, nc) && (*this)(nr, nc).isPlayable()) {
      return true;
    }
  }
  return false;
}

bool Grid::canPlaceClueBox(int row, int col) const {
  if (!contains(row, col)) {
    return false;
  }
  // the bottom-right 2x2 corner never holds a clue box
  if (row >= rows - 2 && col >= cols - 2) {
    return false;
  }

  for (const Position &d : orthogonalSteps) {
    const int nr = row + d.row;
    const int nc = col + d.col;
    if (contains(nr, nc) && (*this)(nr, nc).type == CellType::ClueBox) {
      return false;
    }
  }

  // every playable neighbor must keep a playable neighbor other than us
  for (const Position &d : orthogonalSteps) {
    const int nr = row + d.row;
    const int nc = col + d.col;
    if (!contains(nr, nc) || !(*this)(nr, nc).isPlayable()) {
      continue;
    }
    bool hasPlayable = false;
    for (const Position &d2 : orthogonalSteps) {
      const int nnr = nr + d2.row;
      const int nnc = nc + d2.col;
      if (nnr == row && nnc == col) {
        continue;
      }
      if (contains(nnr, nnc) && (*this)(nnr, nnc).isPlayable()) {
        hasPlayable = true;
        break;
      }
    }
    if (!hasPlayable) {
      return false;
    }
  }
  return true;
}

void Grid::convertToClueBox(int row, int col, UndoStack *undo) {
  Cell &cell = (*this)(row, col);
  const Position pos{row, col};
  if (undo) {
    const Cell old = cell;
    const bool hadLicenses = licenses.count(pos) != 0;
    const int oldPlayable = playableCount;
    const int oldFilled = filledCount;
    undo->push([this, pos, old, hadLicenses, oldPlayable, oldFilled]() {
      (*this)(pos.row, pos.col) = old;
      if (!hadLicenses) {
        licenses.erase(pos);
      }
      playableCount = oldPlayable;
      filledCount = oldFilled;
    });
  }

  if (cell.isPlayable()) {
    --playableCount;
  }
  cell.type = CellType::ClueBox;
  cell.letter = 0;
  cell.slotIds.clear();
  cell.clues.clear();
  licenses[pos];
}

bool Grid::addClueBox(int row, int col, std::string *reason,
                      UndoStack *undo) {
  if (!contains(row, col)) {
    setReason(reason, "clue box outside bounds at " + at(row, col));
    return false;
  }
  const Cell &cell = (*this)(row, col);
  switch (cell.type) {
  case CellType::ClueBox:
    return true;
  case CellType::BlockerZone:
    setReason(reason, "cannot turn blocker zone into clue box at " +
                          at(row, col));
    return false;
  case CellType::Letter:
    setReason(reason, "cell holds a letter at " + at(row, col));
    return false;
  case CellType::Empty:
    break;
  }
  if (!canPlaceClueBox(row, col)) {
    setReason(reason, "clue box rules violated at " + at(row, col));
    return false;
  }
  convertToClueBox(row, col, undo);
  return true;
}

bool Grid::findClueForStart(int row, int col, Direction direction,
                            Position &out) const {
  bool found = false;
  size_t fewest = 0;
  for (const Position &d : clueOffsets(direction)) {
    const int nr = row + d.row;
    const int nc = col + d.col;
    if (!contains(nr, nc) || (*this)(nr, nc).type != CellType::ClueBox) {
      continue;
    }
    auto it = licenses.find(Position{nr, nc});
    const size_t count = it == licenses.end() ? 0 : it->second.size();
    // spread the load: the least busy clue box wins, offset order on ties
    if (!found || count < fewest) {
      found = true;
      fewest = count;
      out = Position{nr, nc};
    }
  }
  return found;
}

bool Grid::ensureClueBox(int row, int col, Direction direction,
                         Position &out, UndoStack *undo) {
  if (findClueForStart(row, col, direction, out)) {
    return true;
  }
  for (const Position &d : clueOffsets(direction)) {
    const int nr = row + d.row;
    const int nc = col + d.col;
    if (!contains(nr, nc) || (*this)(nr, nc).type != CellType::Empty) {
      continue;
    }
    if (addClueBox(nr, nc, nullptr, undo)) {
      out = Position{nr, nc};
      return true;
    }
  }
  return false;
}

bool Grid::startHasClueCapacity(int row, int col, Direction direction) const {
  for (const Position &d : clueOffsets(direction)) {
    const int nr = row + d.row;
    const int nc = col + d.col;
    if (!contains(nr, nc)) {
      continue;
    }
    const Cell &neighbor = (*this)(nr, nc);
    if (neighbor.type == CellType::ClueBox) {
      return true;
    }
    if (neighbor.type == CellType::Empty && canPlaceClueBox(nr, nc)) {
      return true;
    }
  }
  return false;
}

void Grid::moveSlotToClue(const std::string &slotId, Position newClue) {
  WordSlot *slot = findSlot(slotId);
  if (!slot || slot->clueBox == newClue) {
    return;
  }
  const Position oldClue = slot->clueBox;
  licenses[newClue].insert(slotId);
  auto it = licenses.find(oldClue);
  if (it != licenses.end()) {
    it->second.erase(slotId);
  }
  slot->clueBox = newClue;

  Cell &oldCell = (*this)(oldClue.row, oldClue.col);
  Cell &newCell = (*this)(newClue.row, newClue.col);
  for (auto ci = oldCell.clues.begin(); ci != oldCell.clues.end();) {
    if (ci->slotId != slotId) {
      ++ci;
      continue;
    }
    Clue clue = *ci;
    clue.offsetRow = slot->row - newClue.row;
    clue.offsetCol = slot->col - newClue.col;
    newCell.clues.push_back(clue);
    ci = oldCell.clues.erase(ci);
  }
}

void Grid::hostClue(Position clueBox, const Clue &clue) {
  (*this)(clueBox.row, clueBox.col).clues.push_back(clue);
}

void Grid::clearHostedClues() {
  for (Cell &cell : cells) {
    cell.clues.clear();
  }
}

/***** words *****/

bool Grid::checkWord(const std::string &word, int row, int col,
                     Direction direction) const {
  // if I try to place word in (r,c) in a direction, will it work?
  const Position d = step(direction);
  for (size_t j = 0; j < word.size(); ++j) {
    const int r = row + d.row * static_cast<int>(j);
    const int c = col + d.col * static_cast<int>(j);
    if (!contains(r, c)) {
      return false;
    }
    const Cell &cell = (*this)(r, c);
    if (cell.isBlocked()) {
      return false;
    }
    if (cell.letter && cell.letter != word[j]) {
      return false;
    }
  }
  return true;
}

bool Grid::placeWord(const WordSlot &slot, const std::string &text,
                     std::string *reason, UndoStack *undo) {
  if (static_cast<int>(text.size()) != slot.length) {
    setReason(reason, "word length mismatch for " + text);
    return false;
  }
  for (char c : text) {
    if (c < 'A' || c > 'Z') {
      setReason(reason, "word is not uppercase A-Z: " + text);
      return false;
    }
  }
  if (wordSlots.count(slot.id)) {
    setReason(reason, "slot " + slot.id + " already placed");
    return false;
  }
  if (!contains(slot.clueBox.row, slot.clueBox.col) ||
      (*this)(slot.clueBox.row, slot.clueBox.col).type != CellType::ClueBox) {
    setReason(reason, "slot " + slot.id + " is not licensed by a clue box");
    return false;
  }
  if (!checkWord(text, slot.row, slot.col, slot.direction)) {
    setReason(reason, "letter conflict placing " + text + " at " +
                          at(slot.row, slot.col));
    return false;
  }

  struct OldState {
    Position pos;
    CellType type;
    char letter;
  };
  std::vector<OldState> oldStates;
  const std::vector<Position> &positions = slot.cells();
  for (size_t i = 0; i != positions.size(); ++i) {
    Cell &cell = (*this)(positions[i].row, positions[i].col);
    oldStates.push_back(OldState{positions[i], cell.type, cell.letter});
    if (cell.type == CellType::Empty) {
      ++filledCount;
    }
    cell.type = CellType::Letter;
    cell.letter = text[i];
    cell.slotIds.insert(slot.id);
  }

  WordSlot placed(slot);
  placed.text = text;
  wordSlots[slot.id] = placed;
  const bool hadLicenses = licenses.count(slot.clueBox) != 0;
  licenses[slot.clueBox].insert(slot.id);

  if (undo) {
    const std::string id = slot.id;
    const Position clueBox = slot.clueBox;
    undo->push([this, oldStates, id, clueBox, hadLicenses]() {
      for (const OldState &old : oldStates) {
        Cell &cell = (*this)(old.pos.row, old.pos.col);
        cell.slotIds.erase(id);
        if (cell.slotIds.empty()) {
          if (cell.type == CellType::Letter && old.type == CellType::Empty) {
            --filledCount;
          }
          cell.type = old.type;
          cell.letter = old.letter;
        }
      }
      auto it = licenses.find(clueBox);
      if (it != licenses.end()) {
        it->second.erase(id);
        if (!hadLicenses) {
          licenses.erase(it);
        }
      }
      wordSlots.erase(id);
    });
  }
  return true;
}

std::function<void()> Grid::placeWordUndoable(const WordSlot &slot,
                                              const std::string &text,
                                              std::string *reason) {
  UndoStack undo;
  if (!placeWord(slot, text, reason, &undo)) {
    return std::function<void()>();
  }
  return [undo]() mutable { undo.rollback(); };
}

void Grid::removeWord(const std::string &slotId) {
  auto slotIt = wordSlots.find(slotId);
  if (slotIt == wordSlots.end()) {
    return;
  }
  const WordSlot &slot = slotIt->second;
  for (const Position &pos : slot.cells()) {
    Cell &cell = (*this)(pos.row, pos.col);
    cell.slotIds.erase(slotId);
    if (cell.slotIds.empty() && cell.type == CellType::Letter) {
      cell.type = CellType::Empty;
      cell.letter = 0;
      --filledCount;
    }
  }
  auto it = licenses.find(slot.clueBox);
  if (it != licenses.end()) {
    it->second.erase(slotId);
  }
  wordSlots.erase(slotIt);
}

/* After a word is placed the cell right after its last letter has to end
 * the run, otherwise the word would just be a prefix of a longer slot.
 *
 * - off the grid or a blocker zone: nothing to do
 * - a letter: the word runs into a crossing word, which is an error
 * - otherwise it must be (or become) a clue box, unless the span after it
 *   is too short to ever hold another slot; then a clue box there would
 *   strand those cells, so the placement is refused unless a clue box is
 *   already there
 *
 * When a new clue box is planted, the cell after it opens a new start. */
bool Grid::ensureTerminalBoundary(const WordSlot &slot, Position *nextStart,
                                  std::string *reason, UndoStack *undo) {
  if (nextStart) {
    *nextStart = Position{-1, -1};
  }
  const Position d = step(slot.direction);
  const int nextRow = slot.row + d.row * slot.length;
  const int nextCol = slot.col + d.col * slot.length;
  if (!contains(nextRow, nextCol)) {
    return true;
  }
  const Cell &next = (*this)(nextRow, nextCol);
  if (next.type == CellType::BlockerZone) {
    return true;
  }
  if (next.type == CellType::Letter) {
    setReason(reason, "word runs into a letter at " + at(nextRow, nextCol));
    return false;
  }

  const int startRow = nextRow + d.row;
  const int startCol = nextCol + d.col;
  if (!hasCapacityForStart(startRow, startCol, slot.direction)) {
    if (next.type != CellType::ClueBox) {
      setReason(reason, "terminal clue at " + at(nextRow, nextCol) +
                            " would strand unusable cells");
      return false;
    }
    return true;
  }

  if (next.type != CellType::ClueBox &&
      !addClueBox(nextRow, nextCol, reason, undo)) {
    return false;
  }

  if (nextStart && (*this)(startRow, startCol).type == CellType::Empty) {
    *nextStart = Position{startRow, startCol};
  }
  return true;
}

/***** runs *****/

bool Grid::hasCapacityForStart(int row, int col, Direction direction) const {
  const Position d = step(direction);
  int length = 0;
  for (int r = row, c = col; contains(r, c); r += d.row, c += d.col) {
    if ((*this)(r, c).isBlocked()) {
      break;
    }
    if (++length >= 2) {
      return true;
    }
  }
  return false;
}

bool Grid::isBoundary(int row, int col, Direction direction) const {
  const Position d = step(direction);
  const int prevRow = row - d.row;
  const int prevCol = col - d.col;
  if (!contains(prevRow, prevCol)) {
    return true;
  }
  return (*this)(prevRow, prevCol).isBlocked();
}

Extent Grid::findExtent(int row, int col, Direction direction) const {
  Extent extent;
  switch (direction) {
  case Direction::Across:
    /* row is constant */
    for (extent.min = col;
         /* keep walking left as long as the next cell is still on the grid
            and still playable */
         ((extent.min - 1) >= 0) && !(*this)(row, extent.min - 1).isBlocked();
         (extent.min)--)
      ;
    for (extent.max = col; ((extent.max + 1) <= cols - 1) &&
                           !(*this)(row, extent.max + 1).isBlocked();
         (extent.max)++)
      ;
    break;
  case Direction::Down:
    /* col is constant */
    for (extent.min = row;
         ((extent.min - 1) >= 0) && !(*this)(extent.min - 1, col).isBlocked();
         (extent.min)--)
      ;
    for (extent.max = row; ((extent.max + 1) <= rows - 1) &&
                           !(*this)(extent.max + 1, col).isBlocked();
         (extent.max)++)
      ;
  }
  return extent;
}

bool Grid::sameState(const Grid &other) const {
  if (rows != other.rows || cols != other.cols) {
    return false;
  }
  if (cells != other.cells || licenses != other.licenses) {
    return false;
  }
  if (playableCount != other.playableCount ||
      filledCount != other.filledCount || hasBlocker != other.hasBlocker) {
    return false;
  }
  if (wordSlots.size() != other.wordSlots.size()) {
    return false;
  }
  for (const auto &kv : wordSlots) {
    auto it = other.wordSlots.find(kv.first);
    if (it == other.wordSlots.end()) {
      return false;
    }
    const WordSlot &a = kv.second;
    const WordSlot &b = it->second;
    if (a.row != b.row || a.col != b.col || a.direction != b.direction ||
        a.length != b.length || a.clueBox != b.clueBox || a.text != b.text ||
        a.isTheme != b.isTheme) {
      return false;
    }
  }
  return true;
}

std::ostream &operator<<(std::ostream &os, const Grid &grid) {
  os << "Grid is (" << grid.rows << ", " << grid.cols << "), "
     << grid.filledCount << "/" << grid.playableCount << " cells filled"
     << std::endl;
  for (int r = 0; r < grid.rows; r++) {
    for (int c = 0; c < grid.cols; c++) {
      os << cellSymbol(grid(r, c));
    }
    os << std::endl;
  }
  return os;
}
