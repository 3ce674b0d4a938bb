#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "wordlist.h"

#include <sstream>

TEST_CASE("readMasterWordlist merges spellings that fold together",
          "[wordlist]") {
  std::istringstream is("# comment\n"
                        "\n"
                        "pădure;0.4;0.3\n"
                        "PADURE;0.9;0.6;c\n"
                        "bad line\n"
                        "lup;0.2;;s\n"
                        "x-y;notanumber\n");
  const MasterWordlist words = readMasterWordlist(is);

  REQUIRE(words.size() == 2);
  // sorted by surface
  REQUIRE(words[0].surface == "LUP");
  REQUIRE(words[1].surface == "PADURE");

  SECTION("the most frequent spelling wins, flags accumulate") {
    const DictionaryEntry &padure = words[1];
    REQUIRE(padure.length == 6);
    REQUIRE_THAT(padure.frequency, Catch::Matchers::WithinAbs(0.9, 1e-9));
    REQUIRE_THAT(padure.difficulty, Catch::Matchers::WithinAbs(0.6, 1e-9));
    REQUIRE(padure.isCompound);
    REQUIRE_FALSE(padure.isStopword);
  }

  SECTION("a missing difficulty defaults to the middle") {
    const DictionaryEntry &lup = words[0];
    REQUIRE_THAT(lup.difficulty, Catch::Matchers::WithinAbs(0.5, 1e-9));
    REQUIRE(lup.isStopword);
  }
}

TEST_CASE("readMasterWordlistFromFile on a missing file", "[wordlist]") {
  REQUIRE(readMasterWordlistFromFile("/nonexistent/words.txt").empty());
}

TEST_CASE("DictionaryEntry::score follows the requested tier", "[wordlist]") {
  DictionaryEntry easy;
  easy.surface = "CASA";
  easy.length = 4;
  easy.frequency = 0.5;
  easy.difficulty = 0.15;

  // on tier: 0.5 * 0.15 + 1.0 * 0.55 + 0.85 * 0.30
  REQUIRE_THAT(easy.score(Difficulty::Easy),
               Catch::Matchers::WithinAbs(0.88, 1e-9));
  REQUIRE(easy.score(Difficulty::Easy) > easy.score(Difficulty::Medium));
  REQUIRE(easy.score(Difficulty::Medium) > easy.score(Difficulty::Hard));

  DictionaryEntry stopword(easy);
  stopword.isStopword = true;
  REQUIRE(stopword.score(Difficulty::Easy) < easy.score(Difficulty::Easy));

  DictionaryEntry compound(easy);
  compound.isCompound = true;
  REQUIRE(compound.score(Difficulty::Easy) < easy.score(Difficulty::Easy));
  REQUIRE(compound.score(Difficulty::Easy) > stopword.score(Difficulty::Easy));
}

TEST_CASE("difficulty names round trip", "[wordlist]") {
  Difficulty d = Difficulty::Medium;
  REQUIRE(parseDifficulty("easy", d));
  REQUIRE(d == Difficulty::Easy);
  REQUIRE(parseDifficulty("HARD", d));
  REQUIRE(d == Difficulty::Hard);
  REQUIRE(std::string(difficultyName(d)) == "HARD");
  REQUIRE_FALSE(parseDifficulty("impossible", d));
  REQUIRE(d == Difficulty::Hard);
}
