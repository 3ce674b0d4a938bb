#include "generator.h"
#include "index.h"
#include "options.h"
#include "serialize.h"
#include "theme.h"
#include "wordlist.h"

#include <chrono>
#include <ctime>
#include <iostream>
#include <memory>

int main(int argc, char **argv) {
  /* begin: parse command line options, initialize data structures */
  Options options;
  std::string error;
  if (!parseCommandLineOptions(argc, argv, options, error)) {
    std::cerr << error << std::endl;
    printUsage(std::cerr, argv[0]);
    return 1;
  }
  if (options.showHelp) {
    printUsage(std::cout, argv[0]);
    return 0;
  }
  if (options.wordlistPath.empty()) {
    std::cerr << "Must specify wordlist with -w <wordlist>" << std::endl;
    return 1;
  }

  const GeneratorConfig config = makeGeneratorConfig(options);

  const MasterWordlist masterWordlist =
      readMasterWordlistFromFile(options.wordlistPath);
  if (masterWordlist.empty()) {
    std::cerr << "No words loaded from " << options.wordlistPath << std::endl;
    return 1;
  }
  IndexConfig indexConfig = config.toIndexConfig();
  indexConfig.minFrequency = options.minimumFrequency;
  const CandidateIndex index(masterWordlist, indexConfig);
  if (config.verbosity >= 1) {
    std::cout << "Loaded " << index.size() << " words ("
              << masterWordlist.size() << " in the list)" << std::endl;
  }

  std::unique_ptr<UserWordListProvider> userWords;
  if (!options.userWordlistPath.empty()) {
    std::vector<ThemeWord> words;
    if (!readUserWordListFromFile(options.userWordlistPath, words)) {
      return 1;
    }
    userWords = std::make_unique<UserWordListProvider>(words);
  }
  /* end: parse command line options, initialize data structures */

  const clock_t startTime = clock();
  auto wall_clock_start = std::chrono::system_clock::now();

  Generator generator(index, config, userWords.get());
  const CrosswordResult result = generator.generate();

  /* report the results */
  auto wall_clock_finish = std::chrono::system_clock::now();
  const clock_t finishTime = clock();
  std::chrono::duration<double> wall_clock_duration =
      wall_clock_finish - wall_clock_start;
  const double elapsed = double(finishTime - startTime) / CLOCKS_PER_SEC;
  std::cout << "Elapsed Time: " << elapsed << " seconds" << std::endl;
  std::cout << "Elapsed Wall Clock Time: " << wall_clock_duration.count()
            << " seconds" << std::endl;

  if (result.ok) {
    std::cout << "Solution found." << std::endl << *result.grid << std::endl;
    printStats(std::cout, *result.grid);
  } else {
    std::cout << "No solution found: " << result.reason << std::endl;
  }
  if (!options.outputfilePath.empty() &&
      !writeResult(result, options.outputfilePath)) {
    return 1;
  }
  return result.ok ? 0 : 2;
}
