#include <catch2/catch_test_macros.hpp>

#include "grid.h"
#include "helpers.h"

#include <sstream>

TEST_CASE("placing CERB at the top-left of a 6x6 grid", "[grid]") {
  Grid grid = makeGrid(6, 6);

  Position clue{-1, -1};
  REQUIRE(grid.ensureClueBox(0, 0, Direction::Across, clue));
  // nothing left of or above the start, so the clue goes below it
  REQUIRE(clue == Position{1, 0});

  const WordSlot slot("A0001", 0, 0, Direction::Across, 4, clue);
  std::string reason;
  REQUIRE(grid.placeWord(slot, "CERB", &reason));

  REQUIRE(grid(1, 0).type == CellType::ClueBox);
  REQUIRE(grid.getLicenses().at(Position{1, 0}).count("A0001") == 1);
  for (int c = 0; c < 4; ++c) {
    REQUIRE(grid(0, c).type == CellType::Letter);
    REQUIRE(grid(0, c).letter == "CERB"[c]);
    REQUIRE(grid(0, c).slotIds.count("A0001") == 1);
  }
  for (int r = 4; r < 6; ++r) {
    for (int c = 4; c < 6; ++c) {
      REQUIRE(grid(r, c).type != CellType::ClueBox);
    }
  }
  REQUIRE(grid.getFilledCount() == 4);
  REQUIRE(grid.getPlayableCount() == 35);

  SECTION("a terminal clue that would strand one cell is refused") {
    Position next{0, 0};
    REQUIRE_FALSE(grid.ensureTerminalBoundary(slot, &next, &reason));
    REQUIRE(grid(0, 4).type == CellType::Empty);
    REQUIRE(next == Position{-1, -1});
  }
}

TEST_CASE("a placement transaction rolls back completely", "[grid]") {
  Grid grid = makeGrid(6, 8);
  const Grid before(grid);

  UndoStack undo;
  Position clue{-1, -1};
  REQUIRE(grid.ensureClueBox(0, 0, Direction::Across, clue, &undo));
  const WordSlot slot("A0001", 0, 0, Direction::Across, 4, clue);
  REQUIRE(grid.placeWord(slot, "CERB", nullptr, &undo));

  Position next{-1, -1};
  REQUIRE(grid.ensureTerminalBoundary(slot, &next, nullptr, &undo));
  REQUIRE(grid(0, 4).type == CellType::ClueBox);
  REQUIRE(next == Position{0, 5});
  REQUIRE_FALSE(grid.sameState(before));
  REQUIRE(undo.size() == 3);

  undo.rollback();
  REQUIRE(undo.empty());
  REQUIRE(grid.sameState(before));
  REQUIRE(grid.getWordSlots().empty());
  REQUIRE(grid.getLicenses().empty());
}

TEST_CASE("placeWordUndoable hands back its own reversal", "[grid]") {
  Grid grid = makeGrid(4, 4);
  REQUIRE(grid.addClueBox(1, 0));
  const Grid before(grid);

  const WordSlot slot("A0001", 0, 0, Direction::Across, 4, Position{1, 0});
  auto undoPlace = grid.placeWordUndoable(slot, "LUPI");
  REQUIRE(undoPlace);
  REQUIRE(grid(0, 3).letter == 'I');
  undoPlace();
  REQUIRE(grid.sameState(before));

  SECTION("a failed placement returns an empty function") {
    const WordSlot unlicensed("A0002", 2, 0, Direction::Across, 4,
                              Position{3, 0});
    std::string reason;
    REQUIRE_FALSE(grid.placeWordUndoable(unlicensed, "LUPI", &reason));
    REQUIRE(reason.find("not licensed") != std::string::npos);
  }
}

TEST_CASE("placeWord is all or nothing", "[grid]") {
  Grid grid = makeGrid(5, 5);
  REQUIRE(grid.addClueBox(1, 0));
  REQUIRE(grid.addClueBox(0, 2));
  REQUIRE(grid.placeWord(
      WordSlot("A0001", 2, 0, Direction::Across, 5, Position{1, 0}), "MARES"));
  const Grid before(grid);

  std::string reason;
  // crosses MARES at (2,3), where the E sits
  const WordSlot down("D0001", 0, 3, Direction::Down, 4, Position{0, 2});
  REQUIRE_FALSE(grid.placeWord(down, "CASA", &reason));
  REQUIRE(reason.find("letter conflict") != std::string::npos);
  REQUIRE(grid.sameState(before));

  REQUIRE_FALSE(grid.placeWord(down, "CAR", &reason));
  REQUIRE_FALSE(grid.placeWord(down, "ca1e", &reason));
  REQUIRE(grid.sameState(before));

  // a matching crossing shares the cell
  REQUIRE(grid.placeWord(down, "ABEL", &reason));
  REQUIRE(grid(2, 3).slotIds.size() == 2);
  REQUIRE(grid.getFilledCount() == 8);

  grid.removeWord("D0001");
  REQUIRE(grid(2, 3).letter == 'E');
  REQUIRE(grid(1, 3).type == CellType::Empty);
  REQUIRE(grid.getFilledCount() == 5);
}

TEST_CASE("clue box placement rules", "[grid]") {
  Grid grid = makeGrid(5, 5);

  SECTION("never in the bottom-right 2x2") {
    REQUIRE_FALSE(grid.canPlaceClueBox(3, 3));
    REQUIRE_FALSE(grid.canPlaceClueBox(4, 4));
    REQUIRE(grid.canPlaceClueBox(2, 3));
  }

  SECTION("never next to another clue box") {
    REQUIRE(grid.addClueBox(1, 1));
    REQUIRE_FALSE(grid.canPlaceClueBox(1, 2));
    REQUIRE_FALSE(grid.canPlaceClueBox(2, 1));
    REQUIRE(grid.canPlaceClueBox(2, 2));
    std::string reason;
    REQUIRE_FALSE(grid.addClueBox(0, 1, &reason));
    REQUIRE(reason.find("rules violated") != std::string::npos);
  }

  SECTION("never strands a playable neighbor") {
    grid.setBlockerCell(0, 1);
    REQUIRE_FALSE(grid.canPlaceClueBox(1, 0));
  }

  SECTION("never over a blocker or a letter") {
    grid.setBlockerCell(2, 2);
    std::string reason;
    REQUIRE_FALSE(grid.addClueBox(2, 2, &reason));
    REQUIRE_FALSE(grid.addClueBox(9, 9, &reason));
    REQUIRE(reason.find("outside") != std::string::npos);
  }
}

TEST_CASE("findClueForStart prefers the least busy clue box", "[grid]") {
  Grid grid = makeGrid(4, 4);
  REQUIRE(grid.addClueBox(1, 2));
  REQUIRE(grid.addClueBox(2, 1));

  Position clue{-1, -1};
  // both free: the first offset, left of the start, wins
  REQUIRE(grid.findClueForStart(2, 2, Direction::Across, clue));
  REQUIRE(clue == Position{2, 1});

  REQUIRE(grid.placeWord(
      WordSlot("D0001", 3, 1, Direction::Down, 1, Position{2, 1}), "X"));
  REQUIRE(grid.findClueForStart(2, 2, Direction::Across, clue));
  REQUIRE(clue == Position{1, 2});

  REQUIRE_FALSE(grid.findClueForStart(0, 0, Direction::Across, clue));
}

TEST_CASE("a blocker zone at the origin plants the corner clues", "[grid]") {
  GridConfig config;
  config.rows = 8;
  config.cols = 8;
  config.hasBlockerOverride = true;
  config.blockerOverride = BlockerZone{0, 0, 3, 3};
  const Grid grid(config);

  REQUIRE(grid.getBlockerZone() != nullptr);
  REQUIRE(grid.getBlockerZone()->height == 3);
  REQUIRE(grid(2, 2).type == CellType::BlockerZone);
  REQUIRE(grid(0, 3).type == CellType::ClueBox);
  REQUIRE(grid(3, 0).type == CellType::ClueBox);
  REQUIRE(grid.getPlayableCount() == 64 - 9 - 2);
}

TEST_CASE("a random blocker zone depends only on the seed", "[grid]") {
  GridConfig config;
  config.rows = 12;
  config.cols = 12;
  config.seed = 42;
  const Grid a(config);
  const Grid b(config);
  REQUIRE(a.sameState(b));

  const BlockerZone *zone = a.getBlockerZone();
  REQUIRE(zone != nullptr);
  REQUIRE(zone->height >= 3);
  REQUIRE(zone->height <= 6);
  REQUIRE(zone->width >= 3);
  REQUIRE(zone->width <= 6);
  REQUIRE(zone->row + zone->height <= 12);
  REQUIRE(zone->col + zone->width <= 12);
}

TEST_CASE("runs and boundaries", "[grid]") {
  Grid grid = makeGrid(3, 6);
  REQUIRE(grid.addClueBox(0, 2));

  const Extent across = grid.findExtent(0, 4, Direction::Across);
  REQUIRE(across.min == 3);
  REQUIRE(across.max == 5);
  REQUIRE(across.length() == 3);
  REQUIRE(grid.findExtent(1, 2, Direction::Down).length() == 2);

  REQUIRE(grid.isBoundary(0, 0, Direction::Across));
  REQUIRE(grid.isBoundary(0, 3, Direction::Across));
  REQUIRE_FALSE(grid.isBoundary(0, 4, Direction::Across));

  REQUIRE(grid.hasCapacityForStart(0, 0, Direction::Across));
  REQUIRE_FALSE(grid.hasCapacityForStart(0, 5, Direction::Across));
  REQUIRE(grid.startHasClueCapacity(0, 3, Direction::Across));
}

TEST_CASE("the grid prints one symbol per cell", "[grid]") {
  Grid grid = makeGrid(3, 4);
  grid.setBlockerCell(1, 1);
  REQUIRE(grid.addClueBox(0, 0));
  std::ostringstream os;
  os << grid;
  REQUIRE(os.str().find("#...\n.X..\n....\n") != std::string::npos);
}
