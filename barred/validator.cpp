#include "validator.h"

#include <map>
#include <set>

namespace {

std::string at(int row, int col) {
  return "(" + std::to_string(row) + "," + std::to_string(col) + ")";
}

std::string runKey(int row, int col, Direction direction, size_t length) {
  return at(row, col) + directionName(direction) + std::to_string(length);
}

} // namespace

ValidationResult GridValidator::validate(const Grid &grid,
                                         const WordSet &themeWords) const {
  ValidationResult result;
  checkClueBoxes(grid, result.messages);
  checkCells(grid, result.messages);
  checkRuns(grid, collectRuns(grid), themeWords, result.messages);
  checkCounters(grid, result.messages);
  result.ok = result.messages.empty();
  return result;
}

// every maximal run of playable cells of length >= 2, in row-major order of
// its start, across before down
std::vector<GridValidator::Run>
GridValidator::collectRuns(const Grid &grid) const {
  std::vector<Run> runs;
  for (int r = 0; r < grid.getNumRows(); ++r) {
    for (int c = 0; c < grid.getNumCols(); ++c) {
      if (!grid(r, c).isPlayable()) {
        continue;
      }
      for (Direction direction : {Direction::Across, Direction::Down}) {
        if (!grid.isBoundary(r, c, direction)) {
          continue;
        }
        const Position d = step(direction);
        Run run{r, c, direction, ""};
        for (int rr = r, cc = c;
             grid.contains(rr, cc) && grid(rr, cc).isPlayable();
             rr += d.row, cc += d.col) {
          const char letter = grid(rr, cc).letter;
          run.text.push_back(letter ? letter : '.');
        }
        if (run.text.size() >= 2) {
          runs.push_back(run);
        }
      }
    }
  }
  return runs;
}

void GridValidator::checkClueBoxes(const Grid &grid,
                                   std::vector<std::string> &messages) const {
  const Grid::Licenses &licenses = grid.getLicenses();
  const int rows = grid.getNumRows();
  const int cols = grid.getNumCols();

  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      if (grid(r, c).type != CellType::ClueBox) {
        continue;
      }
      auto it = licenses.find(Position{r, c});
      if (it == licenses.end() || it->second.empty()) {
        messages.push_back("clue box at " + at(r, c) +
                           " does not license any word");
      }
      if (r >= rows - 2 && c >= cols - 2) {
        messages.push_back("clue box at " + at(r, c) +
                           " is in the bottom-right 2x2 corner");
      }
      // right and down only, so each adjacent pair is reported once
      if (c + 1 < cols && grid(r, c + 1).type == CellType::ClueBox) {
        messages.push_back("clue box adjacency between " + at(r, c) +
                           " and " + at(r, c + 1));
      }
      if (r + 1 < rows && grid(r + 1, c).type == CellType::ClueBox) {
        messages.push_back("clue box adjacency between " + at(r, c) +
                           " and " + at(r + 1, c));
      }
    }
  }

  for (const auto &kv : licenses) {
    const Position &pos = kv.first;
    if (!grid.contains(pos.row, pos.col) ||
        grid(pos.row, pos.col).type != CellType::ClueBox) {
      messages.push_back("license recorded for non-clue cell " +
                         at(pos.row, pos.col));
      continue;
    }
    for (const std::string &id : kv.second) {
      auto slotIt = grid.getWordSlots().find(id);
      if (slotIt == grid.getWordSlots().end()) {
        messages.push_back("clue box at " + at(pos.row, pos.col) +
                           " licenses unknown slot " + id);
        continue;
      }
      const WordSlot &slot = slotIt->second;
      bool adjacent = false;
      for (const Position &d : Grid::clueOffsets(slot.direction)) {
        if (Position{slot.row + d.row, slot.col + d.col} == pos) {
          adjacent = true;
        }
      }
      if (slot.clueBox != pos || !adjacent) {
        messages.push_back("slot " + id + " is licensed by " +
                           at(pos.row, pos.col) +
                           " which is not its clue position");
      }
    }
  }
}

void GridValidator::checkCells(const Grid &grid,
                               std::vector<std::string> &messages) const {
  for (int r = 0; r < grid.getNumRows(); ++r) {
    for (int c = 0; c < grid.getNumCols(); ++c) {
      const Cell &cell = grid(r, c);
      switch (cell.type) {
      case CellType::Empty:
        if (!grid.hasPlayableNeighbor(r, c)) {
          messages.push_back("isolated cell at " + at(r, c));
        }
        messages.push_back("cell at " + at(r, c) + " was left empty");
        break;
      case CellType::Letter:
        if (cell.letter < 'A' || cell.letter > 'Z') {
          messages.push_back("invalid letter at " + at(r, c));
        }
        if (cell.slotIds.empty()) {
          messages.push_back("letter at " + at(r, c) + " belongs to no slot");
        }
        break;
      case CellType::ClueBox:
      case CellType::BlockerZone:
        if (cell.letter || !cell.slotIds.empty()) {
          messages.push_back("blocked cell at " + at(r, c) + " holds a word");
        }
        break;
      }
      for (const std::string &id : cell.slotIds) {
        if (!grid.getWordSlots().count(id)) {
          messages.push_back("cell at " + at(r, c) + " refers to unknown slot " +
                             id);
        }
      }
    }
  }
}

void GridValidator::checkRuns(const Grid &grid, const std::vector<Run> &runs,
                              const WordSet &themeWords,
                              std::vector<std::string> &messages) const {
  std::map<std::string, const WordSlot *> slotsByKey;
  for (const auto &kv : grid.getWordSlots()) {
    const WordSlot &slot = kv.second;
    slotsByKey[runKey(slot.row, slot.col, slot.direction, slot.length)] =
        &slot;
  }

  std::set<std::string> seen;
  std::set<std::string> matched;
  for (const Run &run : runs) {
    const std::string where = at(run.row, run.col);
    const bool complete = run.text.find('.') == std::string::npos;
    if (!complete) {
      messages.push_back("run at " + where + " " +
                         directionName(run.direction) + " is incomplete: " +
                         run.text);
    } else {
      if (run.text.size() >= 3 && !themeWords.count(run.text) &&
          !index.contains(run.text)) {
        messages.push_back("invalid word '" + run.text + "' at " + where);
      }
      if (!seen.insert(run.text).second) {
        messages.push_back("duplicate word '" + run.text + "' at " + where);
      }
    }

    Position clueBox;
    if (!grid.findClueForStart(run.row, run.col, run.direction, clueBox)) {
      messages.push_back("run at " + where + " " +
                         directionName(run.direction) +
                         " has no adjacent clue box");
    }

    const std::string key =
        runKey(run.row, run.col, run.direction, run.text.size());
    auto it = slotsByKey.find(key);
    if (it == slotsByKey.end()) {
      messages.push_back("run at " + where + " " +
                         directionName(run.direction) +
                         " is not a registered slot");
      continue;
    }
    matched.insert(key);
    if (complete && it->second->text != run.text) {
      messages.push_back("slot " + it->second->id + " records '" +
                         it->second->text + "' but the grid reads '" +
                         run.text + "'");
    }
  }

  for (const auto &kv : slotsByKey) {
    if (!matched.count(kv.first)) {
      messages.push_back("slot " + kv.second->id +
                         " does not span a maximal run");
    }
  }
}

void GridValidator::checkCounters(const Grid &grid,
                                  std::vector<std::string> &messages) const {
  int playable = 0;
  int filled = 0;
  for (int r = 0; r < grid.getNumRows(); ++r) {
    for (int c = 0; c < grid.getNumCols(); ++c) {
      if (grid(r, c).isPlayable()) {
        ++playable;
      }
      if (grid(r, c).type == CellType::Letter) {
        ++filled;
      }
    }
  }
  if (playable != grid.getPlayableCount()) {
    messages.push_back("playable counter is " +
                       std::to_string(grid.getPlayableCount()) + ", grid has " +
                       std::to_string(playable));
  }
  if (filled != grid.getFilledCount()) {
    messages.push_back("filled counter is " +
                       std::to_string(grid.getFilledCount()) + ", grid has " +
                       std::to_string(filled));
  }
}
