#pragma once

#include "generator.h"

#include <cstdint>
#include <string>

struct Options {
  double minimumFrequency = 0.0;
  std::string wordlistPath;
  std::string outputfilePath;
  std::string userWordlistPath;

  int rows = 12;
  int cols = 12;
  std::string theme = "natura";
  Difficulty difficulty = Difficulty::Medium;
  std::string language = "Romanian";
  uint32_t seed = 0;
  int retryLimit = 3;
  int concurrentAttempts = 1;
  double timeoutSeconds = 30.0;
  double minThemeCoverage = 0.10;

  bool placeBlockerZone = true;
  bool hasBlockerOverride = false;
  BlockerZone blockerOverride;

  int verbosity = 1;
  bool showHelp = false;
};

// false (with a message in error) on an unknown flag or a bad value
bool parseCommandLineOptions(int argc, char **argv, Options &options,
                             std::string &error);

GeneratorConfig makeGeneratorConfig(const Options &options);

void printUsage(std::ostream &os, const char *program);
