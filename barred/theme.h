#pragma once

#include "wordlist.h"

#include <iostream>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

// a theme-driven seed word and its clue
struct ThemeWord {
  std::string word;
  std::string clue;
  std::string source = "unknown";
};

/* Anything that can come up with theme words. Implementations may throw
 * std::runtime_error when they cannot produce anything; the merge below
 * treats that as "try the next provider". */
class ThemeWordProvider {
public:
  virtual ~ThemeWordProvider() = default;
  virtual std::vector<ThemeWord> generate(const std::string &theme,
                                          size_t limit, Difficulty difficulty,
                                          const std::string &language) = 0;
};

// tier -> words
using ThemeBucket = std::map<Difficulty, std::vector<std::string>>;

/* Placeholder words from fixed buckets keyed by lower-cased theme name.
 * Unknown themes use a generic bucket. On-tier words come first, then the
 * other tiers, each group shuffled with the provider's seed. */
class BuiltinThemeProvider : public ThemeWordProvider {
public:
  explicit BuiltinThemeProvider(uint32_t seed);
  BuiltinThemeProvider(std::map<std::string, ThemeBucket> buckets_,
                       uint32_t seed);

  std::vector<ThemeWord> generate(const std::string &theme, size_t limit,
                                  Difficulty difficulty,
                                  const std::string &language) override;

  // restart the shuffle sequence
  void reseed(uint32_t seed) { rng.seed(seed); }

  static const std::map<std::string, ThemeBucket> &defaultBuckets();
  static const ThemeBucket &fallbackBucket();

private:
  std::map<std::string, ThemeBucket> buckets;
  std::mt19937 rng;
};

/* Theme words supplied by the user, ignoring the theme name. Throws when the
 * list is empty so the merge falls back to the next provider. */
class UserWordListProvider : public ThemeWordProvider {
public:
  explicit UserWordListProvider(std::vector<ThemeWord> words_)
      : words(std::move(words_)) {}

  std::vector<ThemeWord> generate(const std::string &theme, size_t limit,
                                  Difficulty difficulty,
                                  const std::string &language) override;

private:
  std::vector<ThemeWord> words;
};

// WORD or WORD:clue per line; blank lines and '#' comments are skipped
std::vector<ThemeWord> readUserWordList(std::istream &in);
bool readUserWordListFromFile(const std::string &path,
                              std::vector<ThemeWord> &out);

/* Ask primary (if any) for target words, then each fallback while we are
 * short. Words are deduplicated by normalized form, first one wins. A
 * provider that throws is logged and skipped. */
std::vector<ThemeWord>
mergeThemeProviders(ThemeWordProvider *primary,
                    const std::vector<ThemeWordProvider *> &fallbacks,
                    const std::string &theme, size_t target,
                    Difficulty difficulty, const std::string &language,
                    Normalizer normalize = normalizeWord);
