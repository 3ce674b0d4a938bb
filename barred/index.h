#pragma once

#include "wordlist.h"

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

using WordSet = std::set<std::string>;

/* A Pattern describes a slot's current contents, one character per cell:
 * 'A'-'Z' is a fixed letter, anything else (we write '.') is a wildcard.
 * An empty pattern matches every word of the requested length. */
using Pattern = std::string;

struct IndexConfig {
  int minLength = 2;
  int maxLength = 24;
  double minFrequency = 0.0;
  bool excludeStopwords = true;
  bool allowCompounds = false;
  // keep only the best-scored N entries of each length, 0 = keep everything
  size_t maxEntriesPerLength = 0;
  Difficulty difficulty = Difficulty::Medium;
};

/* Read-only candidate index over a loaded word list.
 *
 * For every word length we keep, for each (position, letter) pair, the
 * sorted ids of the words with that letter at that position. A pattern
 * lookup intersects the lists of the fixed positions, smallest first, and
 * stops as soon as the running intersection is empty, so the cost is bounded
 * by the most selective constraint rather than the dictionary size.
 *
 * Nothing mutates after construction; one index is shared by every
 * concurrent generation attempt. */
class CandidateIndex {
public:
  explicit CandidateIndex(const MasterWordlist &words,
                          const IndexConfig &config = IndexConfig(),
                          Normalizer normalize = normalizeWord);

  size_t size() const { return entries.size(); }
  Difficulty getDifficulty() const { return config.difficulty; }

  std::string sanitize(const std::string &text) const {
    return normalize(text);
  }

  // word is normalized before lookup
  bool contains(const std::string &word) const;
  const DictionaryEntry *get(const std::string &word) const;

  // every surface of the given length matching pattern, sorted
  std::vector<std::string> findSurfaces(int length,
                                        const Pattern &pattern = "") const;

  /* Ranked candidates, best first.
   *
   * banned surfaces are excluded, preferred ones get their score boosted.
   * When the index difficulty is not MEDIUM and fallbackFraction > 0, that
   * fraction of limit is reserved for the best MEDIUM-scored words outside
   * the primary pick so a slot always has some off-tier backups. */
  std::vector<const DictionaryEntry *>
  findCandidates(int length, const Pattern &pattern,
                 const WordSet &banned = WordSet(),
                 const WordSet &preferred = WordSet(), size_t limit = 50,
                 double fallbackFraction = 0.0) const;

  bool hasCandidates(int length, const Pattern &pattern,
                     const WordSet &banned = WordSet()) const;

  // number of matching words, without materializing them
  size_t countCandidates(int length, const Pattern &pattern,
                         const WordSet &banned = WordSet()) const;

private:
  using IdList = std::vector<int>;

  struct LengthIndex {
    IdList all;
    // [position * 26 + letter]
    std::vector<IdList> byPositionLetter;
  };

  // points matches at the sorted ids matching pattern: straight into the
  // index when at most one letter is fixed, otherwise into scratch. Returns
  // false when nothing can match.
  bool lookup(int length, const Pattern &pattern, IdList &scratch,
              const IdList *&matches) const;
  size_t bannedHits(const IdList &ids, const WordSet &banned) const;

  IndexConfig config;
  Normalizer normalize;
  std::vector<DictionaryEntry> entries;
  std::vector<double> scores; // entries[i].score(config.difficulty)
  std::unordered_map<std::string, int> idBySurface;
  std::unordered_map<int, LengthIndex> byLength;
};
