#include "core/board.hpp"

#include <cassert>
#include <utility>

namespace penguins {

Board::Board(const std::size_t width, const std::size_t height, std::vector<Field> fields)
    : m_width(width), m_height(height), m_fields(std::move(fields)) {
	assert(m_fields.size() == m_width * m_height);
}

std::size_t Board::width() const {
	return m_width;
}

std::size_t Board::height() const {
	return m_height;
}

bool Board::isValid(const HexCoordinate c) const {
	if (c.x < 0 || c.y < 0 || static_cast<std::size_t>(c.y) >= m_height) {
		return false;
	}
	// Odd rows only use odd columns and vice versa.
	if (c.x % 2 != c.y % 2) {
		return false;
	}
	return static_cast<std::size_t>(c.x / 2) < m_width;
}

const Field& Board::getField(const HexCoordinate c) const {
	assert(isValid(c)); // Callers should check the coordinate.
	return m_fields[index(c)];
}

std::vector<Penguin> Board::getTeamsPenguins(const TeamEnum team) const {
	std::vector<Penguin> penguins;
	for (const auto& field: m_fields) {
		if (field.penguin && field.penguin->team == team) {
			penguins.push_back(*field.penguin);
		}
	}
	return penguins;
}

std::vector<Move> Board::possibleSlidesFrom(const HexCoordinate c, const TeamEnum team) const {
	std::vector<Move> moves;
	if (!isValid(c)) {
		return moves;
	}

	const auto& origin = getField(c);
	if (!origin.penguin || origin.penguin->team != team) {
		return moves;
	}

	for (const auto direction: ALL_DIRECTIONS) {
		auto target = c.neighbor(direction);
		while (isPassable(target)) {
			moves.emplace_back(team, Slide{.from = c, .to = target});
			target = target.neighbor(direction);
		}
	}
	return moves;
}

Board Board::move(const Move& move) const {
	Board next = *this;

	if (const auto from = move.from()) {
		auto& source   = next.m_fields[index(*from)];
		source.penguin = std::nullopt;
		source.fish    = 0u;
	}

	auto& target   = next.m_fields[index(move.to())];
	target.fish    = 0u;
	target.penguin = Penguin{.coordinate = move.to(), .team = move.team()};

	return next;
}

std::size_t Board::index(const HexCoordinate c) const {
	assert(isValid(c));
	const auto cartesian = c.toCartesian();
	return static_cast<std::size_t>(cartesian.y) * m_width + static_cast<std::size_t>(cartesian.x);
}

bool Board::isPassable(const HexCoordinate c) const {
	if (!isValid(c)) {
		return false;
	}
	const auto& field = m_fields[index(c)];
	return !field.isOccupied() && field.fish > 0u;
}

} // namespace penguins
