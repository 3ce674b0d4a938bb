#include "serialize.h"

#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace {

json positionToJson(const Position &pos) { return json::array({pos.row, pos.col}); }

json clueToJson(const Clue &clue) {
  json j;
  j["id"] = clue.id;
  j["text"] = clue.text;
  j["slot_id"] = clue.slotId;
  j["length"] = clue.length;
  j["direction"] = directionName(clue.direction);
  j["offset"] = json::array({clue.offsetRow, clue.offsetCol});
  return j;
}

json cellToJson(const Cell &cell) {
  json j;
  j["type"] = cellTypeName(cell.type);
  if (cell.letter) {
    j["letter"] = std::string(1, cell.letter);
  } else {
    j["letter"] = nullptr;
  }
  j["clues"] = json::array();
  for (const Clue &clue : cell.clues) {
    j["clues"].push_back(clueToJson(clue));
  }
  j["slots"] = json::array();
  for (const std::string &id : cell.slotIds) {
    j["slots"].push_back(id);
  }
  return j;
}

json slotToJson(const WordSlot &slot) {
  json j;
  j["id"] = slot.id;
  j["start"] = json::array({slot.row, slot.col});
  j["direction"] = directionName(slot.direction);
  j["length"] = slot.length;
  j["text"] = slot.text;
  j["clue_box"] = positionToJson(slot.clueBox);
  j["is_theme"] = slot.isTheme;
  return j;
}

} // namespace

json gridToJson(const Grid &grid) {
  json j;
  j["rows"] = grid.getNumRows();
  j["cols"] = grid.getNumCols();
  if (const BlockerZone *zone = grid.getBlockerZone()) {
    j["blocker_zone"] = {{"row", zone->row},
                         {"col", zone->col},
                         {"height", zone->height},
                         {"width", zone->width}};
  } else {
    j["blocker_zone"] = nullptr;
  }

  j["cells"] = json::array();
  for (int r = 0; r < grid.getNumRows(); ++r) {
    json row = json::array();
    for (int c = 0; c < grid.getNumCols(); ++c) {
      row.push_back(cellToJson(grid(r, c)));
    }
    j["cells"].push_back(row);
  }

  j["slots"] = json::array();
  for (const auto &kv : grid.getWordSlots()) {
    j["slots"].push_back(slotToJson(kv.second));
  }
  return j;
}

json resultToJson(const CrosswordResult &result) {
  json j;
  j["ok"] = result.ok;
  j["seed"] = result.seed;
  j["attempt"] = result.attempt;
  if (!result.ok) {
    j["reason"] = result.reason;
  }
  j["grid"] = result.grid ? gridToJson(*result.grid) : json(nullptr);

  j["theme_words"] = json::array();
  for (const ThemeWord &word : result.themeWords) {
    j["theme_words"].push_back(
        {{"word", word.word}, {"clue", word.clue}, {"source", word.source}});
  }
  j["validation_messages"] = result.validationMessages;
  return j;
}

bool writeResult(const CrosswordResult &result, const std::string &filename) {
  std::ofstream out(filename);
  if (!out.is_open()) {
    std::cerr << "Error opening/creating output file " << filename << "."
              << std::endl;
    return false;
  }
  out << resultToJson(result).dump(2) << std::endl;
  return true;
}
