#pragma once

#include "core/board.hpp"
#include "core/move.hpp"
#include "core/types.hpp"

#include <vector>

namespace penguins {

//! Snapshot of one side of the game.
//! \note Copies are fully independent. The opponent is resolved through the owning GameState.
struct Team {
	TeamEnum name;                   //!< Which side this is.
	std::vector<Penguin> penguins{}; //!< Penguins placed by the team.
	unsigned fish{0u};               //!< Score. Sum of harvested fish.
	std::vector<Move> moves{};       //!< Moves made by the team, oldest first.

	explicit Team(TeamEnum name);

	//! Apply a performed move to this team.
	//! \param harvested Fish on the destination field before the move.
	//! \throws std::length_error if the move would add a penguin beyond MAX_PENGUINS. The team stays untouched.
	void recordMove(const Move& move, unsigned harvested);

	bool operator==(const Team&) const = default;
};

} // namespace penguins
