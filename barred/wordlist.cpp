#include "wordlist.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>

namespace {

double tierCenter(Difficulty difficulty) {
  switch (difficulty) {
  case Difficulty::Easy:
    return 0.15;
  case Difficulty::Hard:
    return 0.80;
  case Difficulty::Medium:
    break;
  }
  return 0.45;
}

std::vector<std::string> splitFields(const std::string &line) {
  std::vector<std::string> v;
  size_t i = 0;
  for (size_t j = line.find(';'); j != std::string::npos;
       j = line.find(';', i)) {
    v.push_back(line.substr(i, j - i));
    i = j + 1;
  }
  v.push_back(line.substr(i));
  return v;
}

bool parseNumber(const std::string &text, double &out) {
  std::istringstream is(text);
  double value;
  if (!(is >> value)) {
    return false;
  }
  out = value;
  return true;
}

} // namespace

const char *difficultyName(Difficulty difficulty) {
  switch (difficulty) {
  case Difficulty::Easy:
    return "EASY";
  case Difficulty::Hard:
    return "HARD";
  case Difficulty::Medium:
    break;
  }
  return "MEDIUM";
}

bool parseDifficulty(const std::string &text, Difficulty &out) {
  std::string upper;
  for (char c : text) {
    upper.push_back(
        static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  if (upper == "EASY") {
    out = Difficulty::Easy;
  } else if (upper == "MEDIUM") {
    out = Difficulty::Medium;
  } else if (upper == "HARD") {
    out = Difficulty::Hard;
  } else {
    return false;
  }
  return true;
}

double DictionaryEntry::score(Difficulty target) const {
  double base = frequency;
  if (isCompound) {
    base -= 0.15;
  }
  if (isStopword) {
    base -= 0.3;
  }

  const double distance = std::fabs(difficulty - tierCenter(target));
  const double affinity = std::max(0.0, 1.0 - distance * 3.5);

  // the direction term keeps HARD > MEDIUM > EASY ordering for off-tier
  // words, otherwise very frequent easy words would outrank medium ones
  double direction = 0.5;
  if (target == Difficulty::Easy) {
    direction = 1.0 - difficulty;
  } else if (target == Difficulty::Hard) {
    direction = difficulty;
  }

  return std::max(0.0, base * 0.15 + affinity * 0.55 + direction * 0.30);
}

MasterWordlist readMasterWordlist(std::istream &is, Normalizer normalize) {
  std::map<std::string, DictionaryEntry> merged;

  std::string line;
  int lineNo = 0;
  while (std::getline(is, line)) {
    ++lineNo;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || line[0] == '#') {
      continue;
    }
    const std::vector<std::string> fields = splitFields(line);
    double frequency = 0.0;
    if (fields.size() < 2 || !parseNumber(fields[1], frequency)) {
      std::cerr << "skipping bad line " << lineNo << ": " << line
                << std::endl;
      continue;
    }
    double difficulty = 0.5;
    if (fields.size() >= 3 && !fields[2].empty() &&
        !parseNumber(fields[2], difficulty)) {
      std::cerr << "skipping bad line " << lineNo << ": " << line
                << std::endl;
      continue;
    }
    bool isCompound = false;
    bool isStopword = false;
    if (fields.size() >= 4) {
      isCompound = fields[3].find('c') != std::string::npos;
      isStopword = fields[3].find('s') != std::string::npos;
    }

    const std::string surface = normalize(fields[0]);
    if (surface.empty()) {
      continue;
    }

    auto it = merged.find(surface);
    if (it == merged.end()) {
      DictionaryEntry entry;
      entry.surface = surface;
      entry.length = static_cast<int>(surface.size());
      entry.frequency = frequency;
      entry.difficulty = difficulty;
      entry.isCompound = isCompound;
      entry.isStopword = isStopword;
      merged.emplace(surface, entry);
      continue;
    }

    // another spelling of a word we already have
    DictionaryEntry &entry = it->second;
    entry.isCompound = entry.isCompound || isCompound;
    entry.isStopword = entry.isStopword || isStopword;
    if (frequency > entry.frequency) {
      entry.frequency = frequency;
      entry.difficulty = difficulty;
    }
  }

  MasterWordlist retval;
  retval.reserve(merged.size());
  for (auto &kv : merged) {
    retval.push_back(std::move(kv.second));
  }
  return retval;
}

MasterWordlist readMasterWordlistFromFile(const std::string &filename,
                                          Normalizer normalize) {
  std::ifstream is(filename);
  if (!is.is_open()) {
    std::cerr << "Error: word list " << filename << " cannot be opened"
              << std::endl;
    return MasterWordlist();
  }
  return readMasterWordlist(is, normalize);
}
