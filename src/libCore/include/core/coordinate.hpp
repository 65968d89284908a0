#pragma once

#include <array>
#include <string>

namespace penguins {

struct HexCoordinate;

//! Offset grid position. Column x, row y; origin at the top left of the board.
struct CartesianCoordinate {
	int x, y;

	HexCoordinate toHex() const; //!< Doubled-width hex coordinate of the same field.

	bool operator==(const CartesianCoordinate&) const = default;
};

enum class Direction { Left, Right, UpLeft, UpRight, DownLeft, DownRight };

//! All directions in the order slides are enumerated.
inline constexpr std::array<Direction, 6> ALL_DIRECTIONS{Direction::Left,   Direction::Right,    Direction::UpLeft,
                                                         Direction::UpRight, Direction::DownLeft, Direction::DownRight};

//! Doubled-width hex position. Horizontal neighbours are 2 apart, odd rows are shifted by one.
//! \note Moves and board queries address fields by this coordinate.
struct HexCoordinate {
	int x, y;

	CartesianCoordinate toCartesian() const; //!< Offset grid coordinate of the same field.
	HexCoordinate neighbor(Direction direction) const;

	bool operator==(const HexCoordinate&) const = default;
};

std::string toString(HexCoordinate c); //!< Renders as "(x,y)".

} // namespace penguins
