#include <catch2/catch_test_macros.hpp>

#include "options.h"

#include <sstream>
#include <string>
#include <vector>

namespace {

struct Args {
  explicit Args(std::vector<std::string> args_) : args(std::move(args_)) {
    args.insert(args.begin(), "barredgen");
    for (std::string &arg : args) {
      argv.push_back(&arg[0]);
    }
  }
  int argc() const { return static_cast<int>(argv.size()); }

  std::vector<std::string> args;
  std::vector<char *> argv;
};

bool parse(const std::vector<std::string> &args, Options &options,
           std::string &error) {
  Args a(args);
  return parseCommandLineOptions(a.argc(), a.argv.data(), options, error);
}

} // namespace

TEST_CASE("defaults without flags", "[options]") {
  Options options;
  std::string error;
  REQUIRE(parse({}, options, error));
  REQUIRE(options.rows == 12);
  REQUIRE(options.theme == "natura");
  REQUIRE(options.placeBlockerZone);
  REQUIRE_FALSE(options.showHelp);
}

TEST_CASE("every flag is understood", "[options]") {
  Options options;
  std::string error;
  REQUIRE(parse({"-w", "words.txt", "-m", "0.25", "-o", "out.json", "-u",
                 "theme.txt", "-H", "10", "-W", "14", "-t", "istorie", "-d",
                 "hard", "-l", "English", "-s", "1234", "-r", "5", "-j", "2",
                 "-T", "12.5", "-c", "0.2", "-b", "-v", "-v"},
                options, error));
  REQUIRE(options.wordlistPath == "words.txt");
  REQUIRE(options.minimumFrequency == 0.25);
  REQUIRE(options.outputfilePath == "out.json");
  REQUIRE(options.userWordlistPath == "theme.txt");
  REQUIRE(options.rows == 10);
  REQUIRE(options.cols == 14);
  REQUIRE(options.theme == "istorie");
  REQUIRE(options.difficulty == Difficulty::Hard);
  REQUIRE(options.language == "English");
  REQUIRE(options.seed == 1234u);
  REQUIRE(options.retryLimit == 5);
  REQUIRE(options.concurrentAttempts == 2);
  REQUIRE(options.timeoutSeconds == 12.5);
  REQUIRE(options.minThemeCoverage == 0.2);
  REQUIRE_FALSE(options.placeBlockerZone);
  REQUIRE(options.verbosity == 3);

  const GeneratorConfig config = makeGeneratorConfig(options);
  REQUIRE(config.rows == 10);
  REQUIRE(config.cols == 14);
  REQUIRE(config.seed == 1234u);
  REQUIRE(config.fillTimeoutSeconds == 12.5);
  REQUIRE(config.difficulty == Difficulty::Hard);
  REQUIRE_FALSE(config.placeBlockerZone);
}

TEST_CASE("blocker zone override", "[options]") {
  Options options;
  std::string error;
  REQUIRE(parse({"-B", "0,0,3,4"}, options, error));
  REQUIRE(options.hasBlockerOverride);
  REQUIRE(options.blockerOverride.height == 3);
  REQUIRE(options.blockerOverride.width == 4);
  REQUIRE(makeGeneratorConfig(options).hasBlockerOverride);

  Options bad;
  REQUIRE_FALSE(parse({"-B", "0,0,3"}, bad, error));
  REQUIRE_FALSE(bad.hasBlockerOverride);
  REQUIRE_FALSE(parse({"-B", "0,0,0,4"}, bad, error));
}

TEST_CASE("bad command lines are rejected with a message", "[options]") {
  Options options;
  std::string error;

  REQUIRE_FALSE(parse({"-x", "1"}, options, error));
  REQUIRE(error == "unknown option -x");

  REQUIRE_FALSE(parse({"-w"}, options, error));
  REQUIRE(error == "missing value for -w");

  REQUIRE_FALSE(parse({"-H", "12x"}, options, error));
  REQUIRE(error == "bad value for -H: 12x");

  REQUIRE_FALSE(parse({"-H", "2"}, options, error));
  REQUIRE_FALSE(parse({"-r", "0"}, options, error));
  REQUIRE_FALSE(parse({"-T", "0"}, options, error));
  REQUIRE_FALSE(parse({"-c", "1.5"}, options, error));
  REQUIRE_FALSE(parse({"-d", "extreme"}, options, error));
}

TEST_CASE("help and quiet", "[options]") {
  Options options;
  std::string error;
  REQUIRE(parse({"-v", "-q", "--help"}, options, error));
  REQUIRE(options.verbosity == 0);
  REQUIRE(options.showHelp);

  std::ostringstream os;
  printUsage(os, "barredgen");
  REQUIRE(os.str().find("usage: barredgen -w <wordlist>") == 0);
}
