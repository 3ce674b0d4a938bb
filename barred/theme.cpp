#include "theme.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <stdexcept>

namespace {

std::string toLower(const std::string &text) {
  std::string retval;
  for (char c : text) {
    retval.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return retval;
}

std::string toUpper(const std::string &text) {
  std::string retval;
  for (char c : text) {
    retval.push_back(
        static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  return retval;
}

std::string trim(const std::string &text) {
  const size_t first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const size_t last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

} // namespace

/***** built-in buckets *****/

const std::map<std::string, ThemeBucket> &BuiltinThemeProvider::defaultBuckets() {
  static const std::map<std::string, ThemeBucket> buckets = {
      {"mitologie",
       {{Difficulty::Easy,
         {"APOLON", "ARES", "ATHENA", "HERA", "IRIS", "HERMES", "ODIN", "THOR",
          "DIANA", "EROS", "AURORA", "TITAN", "ATLAS", "PAN", "ZEUS",
          "POSEIDON", "ISIS", "RA"}},
        {Difficulty::Medium,
         {"ANUBIS", "FREIA", "MINERVA", "CERES", "NEMESIS", "HELIOS", "SIRENA",
          "FAUN", "OSIRIS", "DEMETER", "JANUS", "BALDER", "TETHYS"}},
        {Difficulty::Hard,
         {"HESTIA", "SATIR", "EOL", "MORPHEU", "ORACOL", "NEREIDA", "LIBER",
          "CHARON", "ERINIE", "HYPERION", "PROTEU"}}}},
      {"istorie",
       {{Difficulty::Easy,
         {"REGAT", "ARMATA", "REGE", "PATRIA", "SENAT", "FORT", "OPERA",
          "PACT", "COLONIE", "CRONICA", "STEAG", "SCUT", "HARTA", "CRUCE"}},
        {Difficulty::Medium,
         {"LEGIE", "TRON", "VOIEVOD", "ARHIVA", "ARMURA", "CANON", "DOMNIE",
          "TRIBUT", "LEGAT", "TABELA", "DINASTIE", "HERALD", "ARMISTITIU",
          "CRONOGRAF"}},
        {Difficulty::Hard,
         {"CRONIC", "CASTRA", "ARCA", "DICTUM", "RELICVA", "PORTIC",
          "CRONICAR", "EDICT", "SIGILIU", "PAPIRUS", "PALIMPSEST",
          "TRIREMA"}}}},
      {"natura",
       {{Difficulty::Easy,
         {"MUNTE", "BRAD", "LUP", "CERB", "PLOAIE", "CAMP", "IARBA", "PAMANT",
          "OCEAN", "DELTA", "FRUNZA", "LAC", "NISIP", "VANT", "RAPITA"}},
        {Difficulty::Medium,
         {"CODRU", "IZVOR", "STANCA", "LUNCA", "PODIS", "OGOR", "APUS",
          "CASCADA", "FAG", "AURORA", "DESERT", "GROTA", "PENINSULA",
          "ECOSISTEM"}},
        {Difficulty::Hard,
         {"RAPID", "VALURI", "ALBIA", "MOLID", "RACHIT", "SIRET", "TRESTIE",
          "PRAFUL", "ARIN", "GORUN", "ESTUAR", "ZADA", "LIMAN"}}}},
  };
  return buckets;
}

const ThemeBucket &BuiltinThemeProvider::fallbackBucket() {
  static const ThemeBucket bucket = {
      {Difficulty::Easy,
       {"ROMA", "DUNARE", "SOLAR", "VIATA", "LUMEA", "PIATA", "PORT",
        "CETATE"}},
      {Difficulty::Medium,
       {"CARPA", "RITUAL", "LEGAT", "CLIPA", "CAMPIE", "RAZBOI", "ACORD"}},
      {Difficulty::Hard, {"PATRU", "POD", "CLASA", "COLINA"}},
  };
  return bucket;
}

BuiltinThemeProvider::BuiltinThemeProvider(uint32_t seed)
    : BuiltinThemeProvider(defaultBuckets(), seed) {}

BuiltinThemeProvider::BuiltinThemeProvider(
    std::map<std::string, ThemeBucket> buckets_, uint32_t seed)
    : rng(seed) {
  for (auto &kv : buckets_) {
    ThemeBucket &bucket = buckets[toLower(kv.first)];
    for (auto &tier : kv.second) {
      for (const std::string &word : tier.second) {
        if (!word.empty()) {
          bucket[tier.first].push_back(toUpper(word));
        }
      }
    }
  }
}

std::vector<ThemeWord>
BuiltinThemeProvider::generate(const std::string &theme, size_t limit,
                               Difficulty difficulty, const std::string &) {
  const std::string key = toLower(trim(theme));
  auto it = buckets.find(key);
  const ThemeBucket &bucket =
      it == buckets.end() ? fallbackBucket() : it->second;

  std::vector<std::string> onTier;
  std::vector<std::string> offTier;
  for (const auto &tier : bucket) {
    std::vector<std::string> &dest = tier.first == difficulty ? onTier : offTier;
    dest.insert(dest.end(), tier.second.begin(), tier.second.end());
  }
  std::shuffle(onTier.begin(), onTier.end(), rng);
  std::shuffle(offTier.begin(), offTier.end(), rng);

  std::vector<std::string> combined(onTier);
  combined.insert(combined.end(), offTier.begin(), offTier.end());
  if (combined.empty()) {
    for (const auto &tier : fallbackBucket()) {
      combined.insert(combined.end(), tier.second.begin(), tier.second.end());
    }
  }

  const std::string label = key.empty() ? "tema" : trim(theme);
  std::vector<ThemeWord> retval;
  for (size_t i = 0; i < combined.size() && i < limit; ++i) {
    ThemeWord entry;
    entry.word = combined[i];
    entry.clue = "Rezerva " + label + ": " + toLower(combined[i]);
    entry.source = "builtin";
    retval.push_back(entry);
  }
  return retval;
}

/***** user word lists *****/

std::vector<ThemeWord>
UserWordListProvider::generate(const std::string &, size_t limit, Difficulty,
                               const std::string &) {
  if (words.empty()) {
    throw std::runtime_error("user word list is empty");
  }
  const size_t n = std::min(limit, words.size());
  return std::vector<ThemeWord>(words.begin(), words.begin() + n);
}

std::vector<ThemeWord> readUserWordList(std::istream &in) {
  std::vector<ThemeWord> retval;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    ThemeWord entry;
    entry.source = "user";
    const size_t colon = line.find(':');
    if (colon == std::string::npos) {
      entry.word = line;
    } else {
      entry.word = trim(line.substr(0, colon));
      entry.clue = trim(line.substr(colon + 1));
    }
    if (entry.word.empty()) {
      continue;
    }
    if (entry.clue.empty()) {
      entry.clue = entry.word;
    }
    retval.push_back(entry);
  }
  return retval;
}

bool readUserWordListFromFile(const std::string &path,
                              std::vector<ThemeWord> &out) {
  std::ifstream in(path);
  if (!in.is_open()) {
    std::cerr << "Error opening user word list " << path << "." << std::endl;
    return false;
  }
  out = readUserWordList(in);
  return true;
}

/***** merge *****/

std::vector<ThemeWord>
mergeThemeProviders(ThemeWordProvider *primary,
                    const std::vector<ThemeWordProvider *> &fallbacks,
                    const std::string &theme, size_t target,
                    Difficulty difficulty, const std::string &language,
                    Normalizer normalize) {
  std::vector<ThemeWord> collected;
  std::set<std::string> seen;

  auto extend = [&](ThemeWordProvider *provider, const char *role) {
    std::vector<ThemeWord> entries;
    try {
      entries = provider->generate(theme, target, difficulty, language);
    } catch (const std::exception &e) {
      std::cerr << role << " theme provider failed: " << e.what() << std::endl;
      return;
    }
    for (const ThemeWord &entry : entries) {
      const std::string key = normalize(entry.word);
      if (key.empty() || !seen.insert(key).second) {
        continue;
      }
      collected.push_back(entry);
      if (collected.size() >= target) {
        break;
      }
    }
  };

  if (primary) {
    extend(primary, "primary");
  }
  for (ThemeWordProvider *provider : fallbacks) {
    if (collected.size() >= target) {
      break;
    }
    extend(provider, "fallback");
  }
  return collected;
}
