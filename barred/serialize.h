#pragma once

#include "generator.h"
#include "grid.h"

#include <nlohmann/json.hpp>

#include <string>

// {rows, cols, blocker, cells: [[{type, letter, clues, slots}]], slots: [...]}
nlohmann::json gridToJson(const Grid &grid);

// the grid document plus seed, attempt, theme words and validation messages
nlohmann::json resultToJson(const CrosswordResult &result);

// reports on stderr and returns false if the file can't be written
bool writeResult(const CrosswordResult &result, const std::string &filename);
