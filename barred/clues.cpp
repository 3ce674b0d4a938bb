#include "clues.h"

#include <cctype>

std::map<std::string, std::string>
TemplateClueProvider::generate(const std::vector<ClueRequest> &requests) {
  std::map<std::string, std::string> retval;
  for (const ClueRequest &request : requests) {
    std::string base;
    for (size_t i = 0; i != request.word.size(); ++i) {
      const unsigned char c = static_cast<unsigned char>(request.word[i]);
      base.push_back(static_cast<char>(i == 0 ? std::toupper(c)
                                              : std::tolower(c)));
    }
    retval[request.slotId] =
        base + (request.direction == Direction::Across ? " (oriz.)"
                                                       : " (vert.)");
  }
  return retval;
}

std::vector<ClueRequest> clueRequestsFor(const Grid &grid) {
  std::vector<ClueRequest> requests;
  for (const auto &kv : grid.getWordSlots()) {
    const WordSlot &slot = kv.second;
    requests.push_back(
        ClueRequest{slot.id, slot.text, slot.direction, slot.clueBox});
  }
  return requests;
}

void attachClues(Grid &grid, const std::map<std::string, std::string> &texts) {
  std::map<std::string, std::string> themeClues;
  for (int r = 0; r < grid.getNumRows(); ++r) {
    for (int c = 0; c < grid.getNumCols(); ++c) {
      for (const Clue &clue : grid(r, c).clues) {
        if (clue.id == clue.slotId + "-theme") {
          themeClues[clue.slotId] = clue.text;
        }
      }
    }
  }
  grid.clearHostedClues();

  for (const auto &kv : grid.getWordSlots()) {
    const WordSlot &slot = kv.second;
    Clue clue;
    clue.slotId = slot.id;
    clue.length = slot.length;
    clue.direction = slot.direction;
    clue.offsetRow = slot.row - slot.clueBox.row;
    clue.offsetCol = slot.col - slot.clueBox.col;

    auto themeIt = themeClues.find(slot.id);
    if (slot.isTheme && themeIt != themeClues.end()) {
      clue.id = slot.id + "-theme";
      clue.text = themeIt->second;
    } else {
      auto it = texts.find(slot.id);
      clue.id = slot.id + "-clue";
      clue.text = it == texts.end() ? slot.text : it->second;
    }
    grid.hostClue(slot.clueBox, clue);
  }
}
