#pragma once

#include "core/board.hpp"
#include "core/gameState.hpp"
#include "core/move.hpp"

#include <optional>
#include <string>

namespace penguins {

//! Parse a board from text. One line per row, cells separated by whitespace.
//! A cell is a fish count 0-4, 'A' for a penguin of team One or 'B' for team Two.
//! Returns empty on invalid input or if a team has more than MAX_PENGUINS penguins.
std::optional<Board> boardFromString(const std::string& text);

//! Render a board in the format read by boardFromString. Odd rows are indented.
std::string toString(const Board& board);

//! Parse a move in the format written by Move::toString. Returns empty on invalid input.
std::optional<Move> moveFromString(const std::string& text);

//! Starting state for a board. Penguins already on the board are assigned to their teams.
GameState initialState(Board board);

} // namespace penguins
