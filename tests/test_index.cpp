#include <catch2/catch_test_macros.hpp>

#include "helpers.h"
#include "index.h"

#include <algorithm>
#include <string>
#include <vector>

namespace {

bool matches(const std::string &word, const std::string &pattern) {
  for (size_t i = 0; i != pattern.size(); ++i) {
    if (pattern[i] != '.' && pattern[i] != word[i]) {
      return false;
    }
  }
  return true;
}

const std::vector<std::string> sample = {
    "CERB", "CARE", "CASA", "LUPI", "LUPA", "MARE", "MURE", "SARE",
    "SACI", "BRAD", "BRAT", "ARC",  "ARE",  "ORA",  "ACA",  "AB",
    "BA",   "LAC",  "MAC",  "PADURE"};

} // namespace

TEST_CASE("findSurfaces agrees with a linear scan", "[index]") {
  const CandidateIndex index(makeWordlist(sample));
  REQUIRE(index.size() == sample.size());

  const std::vector<std::string> patterns = {
      "....", "C...", ".A.E", "..R.", "BRA.", "L..I", "XX..", "...",
      "A..",  ".R.",  "..",   "A.",   "......", "P....E"};
  for (const std::string &pattern : patterns) {
    std::vector<std::string> expected;
    for (const std::string &word : sample) {
      if (word.size() == pattern.size() && matches(word, pattern)) {
        expected.push_back(word);
      }
    }
    std::sort(expected.begin(), expected.end());

    const int length = static_cast<int>(pattern.size());
    const std::vector<std::string> found = index.findSurfaces(length, pattern);
    INFO("pattern " << pattern);
    REQUIRE(found == expected);
    REQUIRE(index.countCandidates(length, pattern) == expected.size());
    REQUIRE(index.hasCandidates(length, pattern) == !expected.empty());
  }
}

TEST_CASE("fixing more letters never grows the result", "[index]") {
  const CandidateIndex index(makeWordlist(sample));
  const std::vector<std::string> loose = index.findSurfaces(4, "..R.");
  const std::vector<std::string> tight = index.findSurfaces(4, "M.R.");
  REQUIRE(std::includes(loose.begin(), loose.end(), tight.begin(),
                        tight.end()));
  REQUIRE(tight.size() < loose.size());
}

TEST_CASE("a two-word dictionary filtered by first letter", "[index]") {
  const CandidateIndex index(makeWordlist({"AB", "BA"}));
  REQUIRE(index.findSurfaces(2, "A.") == std::vector<std::string>{"AB"});
  REQUIRE(index.findSurfaces(2) == std::vector<std::string>{"AB", "BA"});
}

TEST_CASE("patterns of the wrong length match nothing", "[index]") {
  const CandidateIndex index(makeWordlist(sample));
  REQUIRE(index.findSurfaces(4, "C..").empty());
  REQUIRE(index.findSurfaces(7).empty());
  REQUIRE_FALSE(index.hasCandidates(4, "....."));
}

TEST_CASE("lookups normalize their input", "[index]") {
  const CandidateIndex index(makeWordlist(sample));
  REQUIRE(index.contains("cerb"));
  REQUIRE(index.contains("pădure"));
  REQUIRE_FALSE(index.contains("ZZZ"));
  REQUIRE(index.get("Brad") != nullptr);
  REQUIRE(index.get("Brad")->surface == "BRAD");
  REQUIRE(index.get("nope") == nullptr);
}

TEST_CASE("findCandidates honours banned, preferred and limit", "[index]") {
  const CandidateIndex index(makeWordlist(sample));

  SECTION("equal scores come back alphabetically") {
    const auto found = index.findCandidates(4, ".A.E");
    REQUIRE(found.size() == 3);
    REQUIRE(found[0]->surface == "CARE");
    REQUIRE(found[1]->surface == "MARE");
    REQUIRE(found[2]->surface == "SARE");
  }

  SECTION("banned words are skipped and not counted") {
    const WordSet banned = {"CARE", "ORA"};
    const auto found = index.findCandidates(4, ".A.E", banned);
    REQUIRE(found.size() == 2);
    REQUIRE(found[0]->surface == "MARE");
    REQUIRE(index.countCandidates(4, ".A.E", banned) == 2);
    REQUIRE_FALSE(index.hasCandidates(4, "CARE", banned));
  }

  SECTION("preferred words move to the front") {
    const auto found = index.findCandidates(4, ".A.E", WordSet(), {"SARE"});
    REQUIRE(found[0]->surface == "SARE");
  }

  SECTION("the limit truncates") {
    REQUIRE(index.findCandidates(4, "....", WordSet(), WordSet(), 2).size() ==
            2);
    REQUIRE(index.findCandidates(4, "....", WordSet(), WordSet(), 0).empty());
  }
}

TEST_CASE("off-tier backups fill the reserved share", "[index]") {
  IndexConfig config;
  config.difficulty = Difficulty::Easy;

  MasterWordlist words = makeWordlist({"CASA", "CARE", "CERB"}, 0.5, 0.15);
  const MasterWordlist medium = makeWordlist({"CAPS", "COTA"}, 0.5, 0.45);
  words.insert(words.end(), medium.begin(), medium.end());
  const CandidateIndex index(words, config);

  const auto plain = index.findCandidates(4, "C...", WordSet(), WordSet(), 4);
  REQUIRE(plain.size() == 4);
  REQUIRE(plain[0]->surface == "CARE");

  const auto mixed =
      index.findCandidates(4, "C...", WordSet(), WordSet(), 4, 0.5);
  REQUIRE(mixed.size() == 4);
  // two easy primaries, then the two best MEDIUM-scored leftovers
  REQUIRE(mixed[0]->surface == "CARE");
  REQUIRE(mixed[1]->surface == "CASA");
  REQUIRE(mixed[2]->surface == "CAPS");
  REQUIRE(mixed[3]->surface == "COTA");
}

TEST_CASE("construction filters apply", "[index]") {
  MasterWordlist words = makeWordlist({"ZEBRA", "X", "SI", "PORTOCALA"});
  words[2].isStopword = true;
  words[3].isCompound = true;

  SECTION("defaults drop stopwords, compounds and single letters") {
    const CandidateIndex index(words);
    REQUIRE(index.size() == 1);
    REQUIRE(index.contains("ZEBRA"));
  }

  SECTION("everything allowed") {
    IndexConfig config;
    config.minLength = 1;
    config.excludeStopwords = false;
    config.allowCompounds = true;
    const CandidateIndex index(words, config);
    REQUIRE(index.size() == 4);
  }

  SECTION("length and frequency bounds") {
    IndexConfig config;
    config.maxLength = 4;
    REQUIRE(CandidateIndex(words, config).size() == 0);
    config.maxLength = 24;
    config.minFrequency = 0.6;
    REQUIRE(CandidateIndex(words, config).size() == 0);
  }
}

namespace {

std::string keepCase(const std::string &text) { return text; }

} // namespace

TEST_CASE("entries a normalizer leaves outside A-Z are dropped", "[index]") {
  const CandidateIndex index(makeWordlist({"cerb", "brad", "LUPI", "AB1"}),
                             IndexConfig(), keepCase);
  REQUIRE(index.size() == 1);
  REQUIRE(index.contains("LUPI"));
  REQUIRE_FALSE(index.contains("cerb"));
  REQUIRE(index.findSurfaces(4) == std::vector<std::string>{"LUPI"});
}
