#include "options.h"

#include <sstream>
#include <vector>

namespace {

std::vector<std::string> splitCommas(const std::string &arg) {
  std::vector<std::string> v;
  size_t i = 0;
  for (size_t j = arg.find(','); j != std::string::npos; j = arg.find(',', i)) {
    v.push_back(arg.substr(i, j - i));
    i = j + 1;
  }
  v.push_back(arg.substr(i));
  return v;
}

// the whole of text must be a T
template <typename T> bool parseValue(const std::string &text, T &out) {
  std::istringstream is(text);
  T value;
  if (!(is >> value)) {
    return false;
  }
  char extra;
  if (is >> extra) {
    return false;
  }
  out = value;
  return true;
}

bool parseBlocker(const std::string &arg, BlockerZone &zone) {
  const std::vector<std::string> v = splitCommas(arg);
  if (v.size() != 4) {
    return false;
  }
  BlockerZone parsed;
  if (!parseValue(v[0], parsed.row) || !parseValue(v[1], parsed.col) ||
      !parseValue(v[2], parsed.height) || !parseValue(v[3], parsed.width)) {
    return false;
  }
  if (parsed.row < 0 || parsed.col < 0 || parsed.height < 1 ||
      parsed.width < 1) {
    return false;
  }
  zone = parsed;
  return true;
}

} // namespace

bool parseCommandLineOptions(int argc, char **argv, Options &options,
                             std::string &error) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);

    // flags without a value
    if (arg == "-b") {
      options.placeBlockerZone = false;
      continue;
    } else if (arg == "-v") {
      ++options.verbosity;
      continue;
    } else if (arg == "-q") {
      options.verbosity = 0;
      continue;
    } else if (arg == "-h" || arg == "--help") {
      options.showHelp = true;
      continue;
    }

    if (i + 1 >= argc) {
      error = "missing value for " + arg;
      return false;
    }
    const std::string optarg(argv[++i]);
    bool ok = true;
    if (arg == "-w") {
      options.wordlistPath = optarg;
    } else if (arg == "-m") {
      ok = parseValue(optarg, options.minimumFrequency);
    } else if (arg == "-o") {
      options.outputfilePath = optarg;
    } else if (arg == "-u") {
      options.userWordlistPath = optarg;
    } else if (arg == "-H") {
      ok = parseValue(optarg, options.rows) && options.rows >= 3;
    } else if (arg == "-W") {
      ok = parseValue(optarg, options.cols) && options.cols >= 3;
    } else if (arg == "-t") {
      options.theme = optarg;
    } else if (arg == "-d") {
      ok = parseDifficulty(optarg, options.difficulty);
    } else if (arg == "-l") {
      options.language = optarg;
    } else if (arg == "-s") {
      ok = parseValue(optarg, options.seed);
    } else if (arg == "-r") {
      ok = parseValue(optarg, options.retryLimit) && options.retryLimit >= 1;
    } else if (arg == "-j") {
      ok = parseValue(optarg, options.concurrentAttempts) &&
           options.concurrentAttempts >= 1;
    } else if (arg == "-T") {
      ok = parseValue(optarg, options.timeoutSeconds) &&
           options.timeoutSeconds > 0;
    } else if (arg == "-c") {
      ok = parseValue(optarg, options.minThemeCoverage) &&
           options.minThemeCoverage >= 0 && options.minThemeCoverage <= 1;
    } else if (arg == "-B") {
      ok = parseBlocker(optarg, options.blockerOverride);
      options.hasBlockerOverride = ok;
    } else {
      error = "unknown option " + arg;
      return false;
    }
    if (!ok) {
      error = "bad value for " + arg + ": " + optarg;
      return false;
    }
  }
  return true;
}

GeneratorConfig makeGeneratorConfig(const Options &options) {
  GeneratorConfig config;
  config.rows = options.rows;
  config.cols = options.cols;
  config.theme = options.theme;
  config.difficulty = options.difficulty;
  config.language = options.language;
  config.seed = options.seed;
  config.retryLimit = options.retryLimit;
  config.concurrentAttempts = options.concurrentAttempts;
  config.fillTimeoutSeconds = options.timeoutSeconds;
  config.minThemeCoverage = options.minThemeCoverage;
  config.placeBlockerZone = options.placeBlockerZone;
  config.hasBlockerOverride = options.hasBlockerOverride;
  config.blockerOverride = options.blockerOverride;
  config.verbosity = options.verbosity;
  return config;
}

void printUsage(std::ostream &os, const char *program) {
  os << "usage: " << program << " -w <wordlist> [options]" << std::endl
     << "  -w <file>        dictionary, entry;frequency[;difficulty[;flags]]"
     << std::endl
     << "  -m <freq>        minimum word frequency" << std::endl
     << "  -o <file>        write the crossword as JSON" << std::endl
     << "  -u <file>        user theme words, WORD or WORD:clue per line"
     << std::endl
     << "  -H <rows>        grid height (default 12)" << std::endl
     << "  -W <cols>        grid width (default 12)" << std::endl
     << "  -t <theme>       theme name (default natura)" << std::endl
     << "  -d <tier>        EASY, MEDIUM or HARD" << std::endl
     << "  -l <language>    language passed to theme providers" << std::endl
     << "  -s <seed>        random seed" << std::endl
     << "  -r <n>           attempts before giving up (default 3)"
     << std::endl
     << "  -j <n>           attempts run concurrently (default 1)" << std::endl
     << "  -T <seconds>     solver time budget per attempt (default 30)"
     << std::endl
     << "  -c <fraction>    minimum theme coverage (default 0.10)" << std::endl
     << "  -b               no blocker zone" << std::endl
     << "  -B r,c,h,w       blocker zone at exactly this rectangle" << std::endl
     << "  -v / -q          more / no progress output" << std::endl;
}
