#include "layout.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iostream>

namespace {

const Position orthogonalSteps[4] = {{0, 1}, {1, 0}, {0, -1}, {-1, 0}};
const Direction bothDirections[2] = {Direction::Across, Direction::Down};

bool isComplete(const Pattern &pattern) {
  return pattern.find('.') == std::string::npos;
}

int filledLetters(const Pattern &pattern) {
  return static_cast<int>(
      std::count_if(pattern.begin(), pattern.end(),
                    [](char c) { return c >= 'A' && c <= 'Z'; }));
}

} // namespace

std::string slotKey(int row, int col, Direction direction, int length) {
  return std::to_string(row) + ":" + std::to_string(col) + ":" +
         static_cast<char>(direction) + ":" + std::to_string(length);
}

double scoreLayout(const Grid &grid) {
  const int playable = grid.getPlayableCount();
  if (playable == 0) {
    return 0.0;
  }
  int cluePenalty = 0;
  for (const auto &kv : grid.getLicenses()) {
    if (kv.second.empty()) {
      ++cluePenalty;
    }
    for (const Position &d : orthogonalSteps) {
      const int nr = kv.first.row + d.row;
      const int nc = kv.first.col + d.col;
      if (grid.contains(nr, nc) && grid(nr, nc).type == CellType::ClueBox) {
        cluePenalty += 2;
      }
    }
  }
  int blockerPenalty = 0;
  if (const BlockerZone *zone = grid.getBlockerZone()) {
    blockerPenalty = std::abs(zone->height - zone->width);
  }
  return playable - 3.0 * cluePenalty - blockerPenalty;
}

LayoutEngine::LayoutEngine(Grid &grid_, const CandidateIndex &index_,
                           const LayoutConfig &config_, uint32_t seed)
    : grid(grid_), index(index_), config(config_), rng(seed), slotCounter(0),
      pendingCounter(0) {
  // slots that were committed before we got here still count as occupied
  for (const auto &kv : grid.getWordSlots()) {
    const WordSlot &slot = kv.second;
    occupiedSlots.insert(
        slotKey(slot.row, slot.col, slot.direction, slot.length));
    if (!slot.text.empty()) {
      usedWords.insert(slot.text);
    }
    ++slotCounter;
  }
}

/***** run detection *****/

bool LayoutEngine::buildSignature(int row, int col, Direction direction,
                                  SlotSignature &out) const {
  if (!grid.contains(row, col) || !grid(row, col).isPlayable()) {
    return false;
  }
  const Extent extent = grid.findExtent(row, col, direction);
  if (extent.length() < 2) {
    return false;
  }
  out.direction = direction;
  out.cells.clear();
  if (direction == Direction::Across) {
    out.row = row;
    out.col = extent.min;
    for (int c = extent.min; c <= extent.max; ++c) {
      out.cells.push_back(Position{row, c});
    }
  } else {
    out.row = extent.min;
    out.col = col;
    for (int r = extent.min; r <= extent.max; ++r) {
      out.cells.push_back(Position{r, col});
    }
  }
  return true;
}

Pattern LayoutEngine::signaturePattern(const SlotSignature &signature) const {
  Pattern pattern;
  pattern.reserve(signature.cells.size());
  for (const Position &pos : signature.cells) {
    const char letter = grid(pos.row, pos.col).letter;
    pattern.push_back(letter ? letter : '.');
  }
  return pattern;
}

bool LayoutEngine::isOccupied(const SlotSignature &signature) const {
  return occupiedSlots.count(slotKey(signature.row, signature.col,
                                     signature.direction,
                                     signature.length())) != 0;
}

std::vector<SlotSignature> LayoutEngine::openSlots() const {
  std::vector<SlotSignature> retval;
  for (int r = 0; r < grid.getNumRows(); ++r) {
    for (int c = 0; c < grid.getNumCols(); ++c) {
      if (!grid(r, c).isPlayable()) {
        continue;
      }
      for (Direction direction : bothDirections) {
        if (!grid.isBoundary(r, c, direction)) {
          continue;
        }
        SlotSignature signature;
        if (!buildSignature(r, c, direction, signature)) {
          continue;
        }
        if (isOccupied(signature)) {
          continue;
        }
        retval.push_back(std::move(signature));
      }
    }
  }
  return retval;
}

/***** bookkeeping *****/

std::string LayoutEngine::nextSlotId(Direction direction) const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%c%04d",
                direction == Direction::Across ? 'A' : 'D', slotCounter + 1);
  return buf;
}

void LayoutEngine::registerSlot(const WordSlot &slot) {
  ++slotCounter;
  occupiedSlots.insert(
      slotKey(slot.row, slot.col, slot.direction, slot.length));
  placementHistory.push_back(slot.id);
}

bool LayoutEngine::isValidComplete(const std::string &surface) const {
  return themeSurfaces.count(index.sanitize(surface)) != 0 ||
         index.contains(surface);
}

/***** theme placement *****/

bool LayoutEngine::seedThemeWords(const std::vector<ThemeWord> &words,
                                  std::vector<ThemeWord> &placed,
                                  std::string &reason) {
  const int playable = grid.getPlayableCount();
  const int minLetters =
      std::max(1, static_cast<int>(playable * config.minThemeCoverage));
  const int budget =
      std::max(minLetters, static_cast<int>(playable * config.maxThemeRatio));
  const int longest = std::max(grid.getNumRows(), grid.getNumCols());

  int letters = 0;
  for (const ThemeWord &entry : words) {
    const std::string cleaned = index.sanitize(entry.word);
    if (cleaned.size() < 2 || static_cast<int>(cleaned.size()) > longest) {
      continue;
    }
    if (usedWords.count(cleaned)) {
      continue;
    }
    if (letters >= budget) {
      if (debug()) {
        std::cerr << "theme letter budget reached: " << letters << " letters"
                  << std::endl;
      }
      break;
    }
    if (!placeSpecificWord(cleaned, &entry, true)) {
      continue;
    }
    placed.push_back(entry);
    letters += static_cast<int>(cleaned.size());
  }

  if (letters < minLetters) {
    reason = "insufficient theme coverage: " + std::to_string(letters) + "/" +
             std::to_string(minLetters) + " letters";
    return false;
  }
  if (config.verbosity >= 1) {
    std::cout << "placed " << placed.size() << " theme words (" << letters
              << " letters of " << playable << " playable)" << std::endl;
  }
  return true;
}

bool LayoutEngine::placeSpecificWord(const std::string &word,
                                     const ThemeWord *theme, bool isTheme) {
  if (attemptPendingStart(word, theme, isTheme)) {
    return true;
  }
  std::uniform_int_distribution<int> coin(0, 1);
  for (int i = 0; i < config.themePlacementAttempts; ++i) {
    const Direction direction = bothDirections[coin(rng)];
    const std::vector<Position> starts =
        candidateStarts(static_cast<int>(word.size()), direction);
    if (starts.empty()) {
      continue;
    }
    const Position start = starts[std::uniform_int_distribution<size_t>(
        0, starts.size() - 1)(rng)];
    if (placeWordAt(word, theme, isTheme, direction, start.row, start.col)) {
      return true;
    }
  }
  return false;
}

bool LayoutEngine::attemptPendingStart(const std::string &word,
                                       const ThemeWord *theme, bool isTheme) {
  while (!pending.empty()) {
    const PendingStart next = pending.top();
    pending.pop();
    if (placeWordAt(word, theme, isTheme, next.direction, next.start.row,
                    next.start.col)) {
      return true;
    }
  }
  return false;
}

bool LayoutEngine::placeWordAt(const std::string &word, const ThemeWord *theme,
                               bool isTheme, Direction direction, int row,
                               int col) {
  if (!grid.checkWord(word, row, col, direction) ||
      !grid.isBoundary(row, col, direction)) {
    return false;
  }

  // everything below is one transaction
  UndoStack undo;
  std::string reason;
  Position clueBox;
  if (!grid.ensureClueBox(row, col, direction, clueBox, &undo)) {
    undo.rollback();
    if (debug()) {
      std::cerr << "no clue position for " << word << " at (" << row << ","
                << col << ")" << std::endl;
    }
    return false;
  }

  WordSlot slot(nextSlotId(direction), row, col, direction,
                static_cast<int>(word.size()), clueBox, isTheme);
  Position nextStart;
  if (!grid.placeWord(slot, word, &reason, &undo) ||
      !grid.ensureTerminalBoundary(slot, &nextStart, &reason, &undo) ||
      !validateCrossings(slot, reason)) {
    undo.rollback();
    if (debug()) {
      std::cerr << "rejected " << word << ": " << reason << std::endl;
    }
    return false;
  }
  undo.commit();

  registerSlot(slot);
  usedWords.insert(word);
  if (nextStart.row >= 0) {
    queueStart(nextStart, direction);
  }
  if (theme) {
    attachThemeClue(slot, *theme);
    themeSurfaces.insert(index.sanitize(theme->word));
  }
  return true;
}

bool LayoutEngine::validateCrossings(const WordSlot &slot,
                                     std::string &reason) const {
  const std::string ownKey =
      slotKey(slot.row, slot.col, slot.direction, slot.length);
  for (Direction direction : bothDirections) {
    for (const Position &pos : slot.cells()) {
      SlotSignature signature;
      if (!buildSignature(pos.row, pos.col, direction, signature)) {
        continue;
      }
      const std::string key = slotKey(signature.row, signature.col,
                                      direction, signature.length());
      if (key == ownKey || occupiedSlots.count(key)) {
        continue;
      }
      if (!grid.startHasClueCapacity(signature.row, signature.col,
                                     direction)) {
        reason = "no clue position for crossing start at (" +
                 std::to_string(signature.row) + "," +
                 std::to_string(signature.col) + ")";
        return false;
      }
      if (signature.length() < 3) {
        continue;
      }
      const Pattern pattern = signaturePattern(signature);
      if (isComplete(pattern) && isValidComplete(pattern)) {
        continue;
      }
      if (signature.length() == 3) {
        const size_t count =
            index.countCandidates(3, pattern, usedWords);
        if (count < config.minThreeLetterCandidates) {
          reason = "too few candidates (" + std::to_string(count) +
                   ") for 3-letter crossing " + pattern;
          return false;
        }
      } else if (!index.hasCandidates(signature.length(), pattern,
                                      usedWords)) {
        reason = "no candidates for crossing " + pattern;
        return false;
      }
    }
  }
  return true;
}

std::vector<Position> LayoutEngine::candidateStarts(int length,
                                                    Direction direction) const {
  std::vector<Position> starts;
  for (int r = 0; r < grid.getNumRows(); ++r) {
    for (int c = 0; c < grid.getNumCols(); ++c) {
      if (!grid.isBoundary(r, c, direction)) {
        continue;
      }
      if (slotOverlapsBlock(r, c, direction, length)) {
        continue;
      }
      starts.push_back(Position{r, c});
    }
  }
  return starts;
}

bool LayoutEngine::slotOverlapsBlock(int row, int col, Direction direction,
                                     int length) const {
  const Position d = step(direction);
  for (int i = 0; i < length; ++i) {
    const int r = row + d.row * i;
    const int c = col + d.col * i;
    if (!grid.contains(r, c) || grid(r, c).isBlocked()) {
      return true;
    }
  }
  return false;
}

void LayoutEngine::queueStart(Position start, Direction direction) {
  SlotSignature signature;
  if (!buildSignature(start.row, start.col, direction, signature)) {
    return;
  }
  const Pattern pattern = signaturePattern(signature);
  if (isComplete(pattern)) {
    return;
  }
  // mostly-filled runs first, then the most open ones
  const int filled = filledLetters(pattern);
  const double priority = -(filled * 10.0) + (signature.length() - filled);
  pending.push(PendingStart{priority, pendingCounter++,
                            Position{signature.row, signature.col},
                            direction});
}

void LayoutEngine::attachThemeClue(const WordSlot &slot,
                                   const ThemeWord &theme) {
  Clue clue;
  clue.id = slot.id + "-theme";
  clue.text = theme.clue;
  clue.slotId = slot.id;
  clue.length = slot.length;
  clue.direction = slot.direction;
  clue.offsetRow = slot.row - slot.clueBox.row;
  clue.offsetCol = slot.col - slot.clueBox.col;
  grid.hostClue(slot.clueBox, clue);
}

/***** layout completion *****/

bool LayoutEngine::healIsolatedCells(std::string &reason) {
  for (int r = 0; r < grid.getNumRows(); ++r) {
    for (int c = 0; c < grid.getNumCols(); ++c) {
      if (grid(r, c).type != CellType::Empty || grid.hasPlayableNeighbor(r, c)) {
        continue;
      }
      if (!grid.addClueBox(r, c, &reason)) {
        reason = "isolated cell at (" + std::to_string(r) + "," +
                 std::to_string(c) + ") cannot be healed: " + reason;
        return false;
      }
      if (debug()) {
        std::cerr << "healed isolated cell (" << r << "," << c << ")"
                  << std::endl;
      }
    }
  }
  return true;
}

/* Split every unfinished run longer than maxLength with one clue box.
 *
 * The split point is as close to the middle as possible, but a side of
 * exactly 3 cells costs 10 since 3-letter crossings are the hardest to fill.
 * Offsets 0, 1 and length-1 would leave a side shorter than 2. */
bool LayoutEngine::partitionLongRuns(int maxLength) {
  bool changed = false;
  for (Direction direction : bothDirections) {
    for (int r = 0; r < grid.getNumRows(); ++r) {
      for (int c = 0; c < grid.getNumCols(); ++c) {
        if (!grid(r, c).isPlayable() || !grid.isBoundary(r, c, direction)) {
          continue;
        }
        SlotSignature signature;
        if (!buildSignature(r, c, direction, signature) ||
            signature.length() <= maxLength) {
          continue;
        }
        if (isComplete(signaturePattern(signature))) {
          continue;
        }

        const int length = signature.length();
        const int mid = length / 2;
        auto score = [length, mid](int x) {
          int penalty = 0;
          if (x == 3) {
            penalty += 10;
          }
          if (length - x - 1 == 3) {
            penalty += 10;
          }
          return std::abs(x - mid) + penalty;
        };
        std::vector<int> offsets;
        for (int x = 2; x <= length - 2; ++x) {
          offsets.push_back(x);
        }
        std::stable_sort(offsets.begin(), offsets.end(),
                         [&score](int a, int b) { return score(a) < score(b); });

        for (int offset : offsets) {
          const Position pos = signature.cells[offset];
          const Cell &cell = grid(pos.row, pos.col);
          if (cell.type != CellType::Empty || !cell.slotIds.empty()) {
            continue;
          }
          if (grid.addClueBox(pos.row, pos.col)) {
            if (debug()) {
              std::cerr << "partitioned run at (" << r << "," << c
                        << ") length " << length << " at (" << pos.row << ","
                        << pos.col << ")" << std::endl;
            }
            changed = true;
            break;
          }
        }
      }
    }
  }
  return changed;
}

bool LayoutEngine::ensureAllLicensed(std::string &reason) {
  // each pass can only add clue boxes, so this terminates; the cap is a
  // backstop against a pathological grid
  const int maxPasses = grid.getNumRows() * grid.getNumCols() + 1;
  bool changed = true;
  for (int pass = 0; changed && pass < maxPasses; ++pass) {
    changed = false;
    for (Direction direction : bothDirections) {
      for (int r = 0; r < grid.getNumRows(); ++r) {
        for (int c = 0; c < grid.getNumCols(); ++c) {
          if (!grid(r, c).isPlayable() || !grid.isBoundary(r, c, direction)) {
            continue;
          }
          SlotSignature signature;
          if (!buildSignature(r, c, direction, signature)) {
            continue;
          }
          Position clueBox;
          if (grid.findClueForStart(r, c, direction, clueBox)) {
            continue;
          }
          if (grid.ensureClueBox(r, c, direction, clueBox)) {
            changed = true;
            continue;
          }
          // the start can't be licensed, so turn it into a clue box and
          // eliminate the run altogether
          const Cell &cell = grid(r, c);
          if (cell.type == CellType::Empty && cell.slotIds.empty() &&
              grid.addClueBox(r, c)) {
            if (debug()) {
              std::cerr << "eliminated unlicensable start (" << r << "," << c
                        << ") " << directionName(direction) << std::endl;
            }
            changed = true;
          } else if (debug()) {
            std::cerr << "cannot license start (" << r << "," << c << ") "
                      << directionName(direction) << std::endl;
          }
        }
      }
    }
    if (changed && !healIsolatedCells(reason)) {
      return false;
    }
  }
  return true;
}

bool LayoutEngine::repairOrphanClues() {
  bool repaired = false;
  std::vector<Position> orphans;
  for (const auto &kv : grid.getLicenses()) {
    if (kv.second.empty() &&
        grid(kv.first.row, kv.first.col).type == CellType::ClueBox) {
      orphans.push_back(kv.first);
    }
  }
  for (const Position &pos : orphans) {
    if (assignExistingSlotToClue(pos)) {
      repaired = true;
    }
  }
  return repaired;
}

// move a slot whose start this clue box could license, as long as the slot's
// current clue box keeps at least one other license
bool LayoutEngine::assignExistingSlotToClue(Position cluePos) {
  for (const auto &kv : grid.getWordSlots()) {
    const WordSlot &slot = kv.second;
    bool canLicense = false;
    for (const Position &d : Grid::clueOffsets(slot.direction)) {
      if (Position{slot.row + d.row, slot.col + d.col} == cluePos) {
        canLicense = true;
        break;
      }
    }
    if (!canLicense) {
      continue;
    }
    if (slot.clueBox == cluePos) {
      return true;
    }
    auto it = grid.getLicenses().find(slot.clueBox);
    if (it == grid.getLicenses().end() || it->second.size() <= 1) {
      continue;
    }
    const std::string slotId = slot.id;
    grid.moveSlotToClue(slotId, cluePos);
    if (debug()) {
      std::cerr << "reassigned slot " << slotId << " to clue (" << cluePos.row
                << "," << cluePos.col << ")" << std::endl;
    }
    return true;
  }
  return false;
}

bool LayoutEngine::verifyFeasibility(std::string &reason, bool &repaired) {
  repaired = false;
  for (const SlotSignature &signature : openSlots()) {
    if (signature.length() < 3) {
      continue;
    }
    const Pattern pattern = signaturePattern(signature);
    if (isComplete(pattern)) {
      if (isValidComplete(pattern)) {
        continue;
      }
      reason = "prefilled invalid word " + pattern + " at (" +
               std::to_string(signature.row) + "," +
               std::to_string(signature.col) + ")";
      return false;
    }
    if (index.hasCandidates(signature.length(), pattern, usedWords)) {
      continue;
    }
    // the run just moved under us, let the caller recheck the new layout
    if (signature.length() <= 4 && tryPartitionInfeasible(signature)) {
      repaired = true;
      return true;
    }
    reason = "infeasible slot " + pattern + " at (" +
             std::to_string(signature.row) + "," +
             std::to_string(signature.col) + ")";
    return false;
  }
  return true;
}

bool LayoutEngine::tryPartitionInfeasible(const SlotSignature &signature) {
  for (int offset = 1; offset < signature.length(); ++offset) {
    const Position pos = signature.cells[offset];
    const Cell &cell = grid(pos.row, pos.col);
    if (cell.type != CellType::Empty || !cell.slotIds.empty()) {
      continue;
    }
    if (grid.addClueBox(pos.row, pos.col)) {
      if (config.verbosity >= 1) {
        std::cout << "partitioned infeasible slot at (" << signature.row << ","
                  << signature.col << ") with clue at (" << pos.row << ","
                  << pos.col << ")" << std::endl;
      }
      return true;
    }
  }
  return false;
}

bool LayoutEngine::completeLayout(std::string &reason) {
  if (!healIsolatedCells(reason)) {
    return false;
  }

  // coarse pass first, then fine, so slots end up mostly 4-8 long
  for (int maxLength : config.partitionThresholds) {
    for (int i = 0; i < config.partitionIterations; ++i) {
      if (!partitionLongRuns(maxLength)) {
        break;
      }
      if (!healIsolatedCells(reason)) {
        return false;
      }
    }
  }

  for (int round = 0; round < config.completionRounds; ++round) {
    if (!ensureAllLicensed(reason)) {
      return false;
    }
    repairOrphanClues();
    bool repaired = false;
    if (!verifyFeasibility(reason, repaired)) {
      return false;
    }
    if (!repaired) {
      return true;
    }
    if (!healIsolatedCells(reason)) {
      return false;
    }
  }
  reason = "layout did not settle after " +
           std::to_string(config.completionRounds) + " rounds";
  return false;
}

/***** commits from the fill *****/

bool LayoutEngine::commitSignature(const SlotSignature &signature,
                                   const std::string &word,
                                   std::string &reason) {
  Position clueBox;
  if (!grid.findClueForStart(signature.row, signature.col,
                             signature.direction, clueBox)) {
    reason = "slot at (" + std::to_string(signature.row) + "," +
             std::to_string(signature.col) + ") has no clue box";
    return false;
  }
  WordSlot slot(nextSlotId(signature.direction), signature.row, signature.col,
                signature.direction, signature.length(), clueBox);
  if (!grid.placeWord(slot, word, &reason)) {
    return false;
  }
  registerSlot(slot);
  usedWords.insert(word);
  return true;
}
