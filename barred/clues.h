#pragma once

#include "grid.h"

#include <map>
#include <string>
#include <vector>

struct ClueRequest {
  std::string slotId;
  std::string word;
  Direction direction;
  Position clueBox;
};

class ClueTextProvider {
public:
  virtual ~ClueTextProvider() = default;
  // slot id -> clue text; slots left out fall back to their word
  virtual std::map<std::string, std::string>
  generate(const std::vector<ClueRequest> &requests) = 0;
};

// "Word (oriz.)" for across slots, "Word (vert.)" for down
class TemplateClueProvider : public ClueTextProvider {
public:
  std::map<std::string, std::string>
  generate(const std::vector<ClueRequest> &requests) override;
};

// one request per committed slot, in slot id order
std::vector<ClueRequest> clueRequestsFor(const Grid &grid);

/* Rebuild every hosted clue from scratch. A slot that was placed as a theme
 * word keeps its theme clue; every other slot gets texts[id], or its word
 * when the provider had nothing for it. */
void attachClues(Grid &grid, const std::map<std::string, std::string> &texts);
