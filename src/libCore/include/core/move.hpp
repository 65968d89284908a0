#pragma once

#include "core/coordinate.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace penguins {

//! Put a new penguin onto a field.
struct Place {
	HexCoordinate to;

	bool operator==(const Place&) const = default;
};

//! Slide an existing penguin along a line.
struct Slide {
	HexCoordinate from;
	HexCoordinate to;

	bool operator==(const Slide&) const = default;
};

using MoveAction = std::variant<Place, Slide>;

//! A move made by one team.
class Move {
public:
	Move(TeamEnum team, MoveAction action);

	TeamEnum team() const;
	const MoveAction& action() const;

	HexCoordinate to() const;                  //!< Destination field.
	std::optional<HexCoordinate> from() const; //!< Source field. Empty for placements.
	bool isPlacement() const;

	std::string toString() const; //!< "ONE place (x,y)" or "TWO slide (x,y)->(x,y)".

	bool operator==(const Move&) const = default;

private:
	TeamEnum m_team;
	MoveAction m_action;
};

} // namespace penguins
