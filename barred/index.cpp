#include "index.h"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace {

bool isFixed(char c) { return c >= 'A' && c <= 'Z'; }

} // namespace

CandidateIndex::CandidateIndex(const MasterWordlist &words,
                               const IndexConfig &config_,
                               Normalizer normalize_)
    : config(config_), normalize(normalize_) {
  // merge by surface first, the caller may hand us unmerged entries
  std::unordered_map<std::string, size_t> seen;
  std::vector<DictionaryEntry> kept;
  for (const DictionaryEntry &word : words) {
    DictionaryEntry entry(word);
    entry.surface = normalize(entry.surface);
    entry.length = static_cast<int>(entry.surface.size());
    // the position tables only have room for A-Z
    if (!isGridWord(entry.surface)) {
      continue;
    }
    if (entry.length < config.minLength || entry.length > config.maxLength) {
      continue;
    }
    if (entry.frequency < config.minFrequency) {
      continue;
    }
    if (config.excludeStopwords && entry.isStopword) {
      continue;
    }
    if (entry.isCompound && !config.allowCompounds) {
      continue;
    }
    auto it = seen.find(entry.surface);
    if (it == seen.end()) {
      seen.emplace(entry.surface, kept.size());
      kept.push_back(std::move(entry));
    } else if (entry.frequency > kept[it->second].frequency) {
      kept[it->second] = std::move(entry);
    }
  }

  const Difficulty difficulty = config.difficulty;
  if (config.maxEntriesPerLength > 0) {
    std::unordered_map<int, std::vector<DictionaryEntry>> grouped;
    for (DictionaryEntry &entry : kept) {
      grouped[entry.length].push_back(std::move(entry));
    }
    kept.clear();
    for (auto &kv : grouped) {
      std::vector<DictionaryEntry> &group = kv.second;
      std::stable_sort(group.begin(), group.end(),
                       [difficulty](const DictionaryEntry &a,
                                    const DictionaryEntry &b) {
                         const double sa = a.score(difficulty);
                         const double sb = b.score(difficulty);
                         if (sa != sb) {
                           return sa > sb;
                         }
                         return a.surface < b.surface;
                       });
      if (group.size() > config.maxEntriesPerLength) {
        group.resize(config.maxEntriesPerLength);
      }
      std::move(group.begin(), group.end(), std::back_inserter(kept));
    }
  }

  // ids are assigned in surface order so every id list is sorted and the
  // index comes out the same whatever order the words were loaded in
  std::sort(kept.begin(), kept.end(),
            [](const DictionaryEntry &a, const DictionaryEntry &b) {
              return a.surface < b.surface;
            });
  entries = std::move(kept);
  scores.reserve(entries.size());

  for (size_t i = 0; i != entries.size(); ++i) {
    const DictionaryEntry &entry = entries[i];
    const int id = static_cast<int>(i);
    scores.push_back(entry.score(difficulty));
    idBySurface.emplace(entry.surface, id);

    LengthIndex &index = byLength[entry.length];
    if (index.byPositionLetter.empty()) {
      index.byPositionLetter.resize(entry.length * 26);
    }
    index.all.push_back(id);
    for (int pos = 0; pos != entry.length; ++pos) {
      index.byPositionLetter[pos * 26 + (entry.surface[pos] - 'A')].push_back(
          id);
    }
  }
}

bool CandidateIndex::contains(const std::string &word) const {
  return idBySurface.count(normalize(word)) != 0;
}

const DictionaryEntry *CandidateIndex::get(const std::string &word) const {
  auto it = idBySurface.find(normalize(word));
  if (it == idBySurface.end()) {
    return nullptr;
  }
  return &entries[it->second];
}

bool CandidateIndex::lookup(int length, const Pattern &pattern,
                            IdList &scratch, const IdList *&matches) const {
  auto it = byLength.find(length);
  if (it == byLength.end()) {
    return false;
  }
  const LengthIndex &index = it->second;
  if (!pattern.empty() && static_cast<int>(pattern.size()) != length) {
    return false;
  }

  std::vector<const IdList *> constraints;
  for (size_t pos = 0; pos != pattern.size(); ++pos) {
    if (!isFixed(pattern[pos])) {
      continue;
    }
    const IdList &list = index.byPositionLetter[pos * 26 + (pattern[pos] - 'A')];
    if (list.empty()) {
      return false;
    }
    constraints.push_back(&list);
  }

  if (constraints.empty()) {
    matches = &index.all;
    return !index.all.empty();
  }
  if (constraints.size() == 1) {
    matches = constraints[0];
    return true;
  }

  // smallest first keeps every intermediate result as small as possible
  std::sort(constraints.begin(), constraints.end(),
            [](const IdList *a, const IdList *b) {
              return a->size() < b->size();
            });
  scratch = *constraints[0];
  IdList next;
  for (size_t i = 1; i != constraints.size(); ++i) {
    next.clear();
    std::set_intersection(scratch.begin(), scratch.end(),
                          constraints[i]->begin(), constraints[i]->end(),
                          std::back_inserter(next));
    scratch.swap(next);
    if (scratch.empty()) {
      return false;
    }
  }
  matches = &scratch;
  return true;
}

size_t CandidateIndex::bannedHits(const IdList &ids,
                                  const WordSet &banned) const {
  size_t hits = 0;
  for (const std::string &word : banned) {
    auto it = idBySurface.find(word);
    if (it == idBySurface.end()) {
      continue;
    }
    if (std::binary_search(ids.begin(), ids.end(), it->second)) {
      ++hits;
    }
  }
  return hits;
}

std::vector<std::string> CandidateIndex::findSurfaces(
    int length, const Pattern &pattern) const {
  std::vector<std::string> retval;
  IdList scratch;
  const IdList *matches = nullptr;
  if (!lookup(length, pattern, scratch, matches)) {
    return retval;
  }
  retval.reserve(matches->size());
  for (int id : *matches) {
    retval.push_back(entries[id].surface);
  }
  return retval;
}

std::vector<const DictionaryEntry *> CandidateIndex::findCandidates(
    int length, const Pattern &pattern, const WordSet &banned,
    const WordSet &preferred, size_t limit, double fallbackFraction) const {
  std::vector<const DictionaryEntry *> retval;
  IdList scratch;
  const IdList *matches = nullptr;
  if (!lookup(length, pattern, scratch, matches) || limit == 0) {
    return retval;
  }

  struct Ranked {
    int id;
    double score;
  };
  std::vector<Ranked> ranked;
  ranked.reserve(matches->size());
  for (int id : *matches) {
    const std::string &surface = entries[id].surface;
    if (banned.count(surface)) {
      continue;
    }
    double score = scores[id];
    if (preferred.count(surface)) {
      score *= 1.4;
    }
    ranked.push_back(Ranked{id, score});
  }
  // ties fall back to id order, i.e. alphabetical, to stay deterministic
  std::sort(ranked.begin(), ranked.end(),
            [](const Ranked &a, const Ranked &b) {
              if (a.score != b.score) {
                return a.score > b.score;
              }
              return a.id < b.id;
            });

  if (fallbackFraction <= 0.0 || config.difficulty == Difficulty::Medium) {
    const size_t n = std::min(limit, ranked.size());
    for (size_t i = 0; i != n; ++i) {
      retval.push_back(&entries[ranked[i].id]);
    }
    return retval;
  }

  // split the limit between the primary tier and MEDIUM-scored backups
  size_t fallbackN = static_cast<size_t>(
      std::lround(static_cast<double>(limit) * fallbackFraction));
  fallbackN = std::max<size_t>(1, std::min(fallbackN, limit));
  const size_t primaryN = std::min(limit - fallbackN, ranked.size());

  for (size_t i = 0; i != primaryN; ++i) {
    retval.push_back(&entries[ranked[i].id]);
  }

  std::vector<int> secondary;
  for (size_t i = primaryN; i < ranked.size(); ++i) {
    secondary.push_back(ranked[i].id);
  }
  std::stable_sort(secondary.begin(), secondary.end(), [this](int a, int b) {
    return entries[a].score(Difficulty::Medium) >
           entries[b].score(Difficulty::Medium);
  });
  if (secondary.size() > fallbackN) {
    secondary.resize(fallbackN);
  }
  for (int id : secondary) {
    retval.push_back(&entries[id]);
  }
  return retval;
}

bool CandidateIndex::hasCandidates(int length, const Pattern &pattern,
                                   const WordSet &banned) const {
  return countCandidates(length, pattern, banned) > 0;
}

size_t CandidateIndex::countCandidates(int length, const Pattern &pattern,
                                       const WordSet &banned) const {
  IdList scratch;
  const IdList *matches = nullptr;
  if (!lookup(length, pattern, scratch, matches)) {
    return 0;
  }
  return matches->size() - bannedHits(*matches, banned);
}
