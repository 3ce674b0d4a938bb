#pragma once

#include "normalize.h"

#include <istream>
#include <string>
#include <vector>

enum class Difficulty { Easy, Medium, Hard };

const char *difficultyName(Difficulty difficulty);
// accepts EASY/MEDIUM/HARD in any case, returns false on anything else
bool parseDifficulty(const std::string &text, Difficulty &out);

/* One normalized dictionary word.
 *
 * surface is the folded, uppercase form that goes into the grid; every raw
 * spelling that folds to the same surface is merged into one entry.
 * frequency and difficulty are both precomputed in [0, 1]. */
struct DictionaryEntry {
  std::string surface;
  int length = 0;
  double frequency = 0.0;
  double difficulty = 0.0;
  bool isCompound = false;
  bool isStopword = false;

  // ranking score for a target tier, higher is better
  double score(Difficulty target) const;
};

using MasterWordlist = std::vector<DictionaryEntry>;

// word list lines look like
//
//   entry;frequency[;difficulty[;flags]]
//
// where flags is any combination of 'c' (compound) and 's' (stopword).
// Lines starting with '#' and blank lines are skipped; malformed lines are
// reported on stderr and skipped. Entries are merged by normalized surface,
// keeping the highest frequency, and returned sorted by surface.
MasterWordlist readMasterWordlist(std::istream &is,
                                  Normalizer normalize = normalizeWord);

// returns an empty list (after reporting on stderr) if the file can't be read
MasterWordlist readMasterWordlistFromFile(const std::string &filename,
                                          Normalizer normalize = normalizeWord);
