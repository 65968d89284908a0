#pragma once

#include <cstddef>
#include <string>

namespace penguins {

//! Number of penguins each team places before the movement phase starts.
inline constexpr std::size_t MAX_PENGUINS = 4u;

//! The two sides of a game. Team One moves first.
enum class TeamEnum { One = 1, Two = 2 };

//! Returns the opponent enum value of input team.
inline constexpr TeamEnum opponent(TeamEnum team) {
	return team == TeamEnum::One ? TeamEnum::Two : TeamEnum::One;
}

//! Returns "ONE" or "TWO".
inline std::string toString(TeamEnum team) {
	return team == TeamEnum::One ? "ONE" : "TWO";
}

} // namespace penguins
