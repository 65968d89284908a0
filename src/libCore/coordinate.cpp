#include "core/coordinate.hpp"

#include <format>

namespace penguins {

HexCoordinate CartesianCoordinate::toHex() const {
	return {x * 2 + (y % 2 == 1 ? 1 : 0), y};
}

CartesianCoordinate HexCoordinate::toCartesian() const {
	return {x / 2, y};
}

HexCoordinate HexCoordinate::neighbor(const Direction direction) const {
	switch (direction) {
	case Direction::Left:
		return {x - 2, y};
	case Direction::Right:
		return {x + 2, y};
	case Direction::UpLeft:
		return {x - 1, y - 1};
	case Direction::UpRight:
		return {x + 1, y - 1};
	case Direction::DownLeft:
		return {x - 1, y + 1};
	case Direction::DownRight:
		return {x + 1, y + 1};
	}
	return *this;
}

std::string toString(const HexCoordinate c) {
	return std::format("({},{})", c.x, c.y);
}

} // namespace penguins
