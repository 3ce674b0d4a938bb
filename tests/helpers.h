#pragma once

#include "grid.h"
#include "index.h"
#include "wordlist.h"

#include <string>
#include <vector>

inline MasterWordlist makeWordlist(const std::vector<std::string> &words,
                                   double frequency = 0.5,
                                   double difficulty = 0.45) {
  MasterWordlist list;
  for (const std::string &word : words) {
    DictionaryEntry entry;
    entry.surface = word;
    entry.length = static_cast<int>(word.size());
    entry.frequency = frequency;
    entry.difficulty = difficulty;
    list.push_back(entry);
  }
  return list;
}

// no blocker zone, no corner clue: exactly what the test builds
inline Grid makeGrid(int rows, int cols) {
  GridConfig config;
  config.rows = rows;
  config.cols = cols;
  config.placeBlockerZone = false;
  config.plantTopLeftClue = false;
  return Grid(config);
}

/* 3x4 with two across slots of length 3 and nothing else:
 *
 *   #...
 *   XXXX
 *   #...
 */
inline Grid twoSlotGrid() {
  Grid grid = makeGrid(3, 4);
  for (int c = 0; c < 4; ++c) {
    grid.setBlockerCell(1, c);
  }
  grid.addClueBox(0, 0);
  grid.addClueBox(2, 0);
  return grid;
}

inline bool hasMessage(const std::vector<std::string> &messages,
                       const std::string &fragment) {
  for (const std::string &message : messages) {
    if (message.find(fragment) != std::string::npos) {
      return true;
    }
  }
  return false;
}
