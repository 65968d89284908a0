#pragma once

#include "core/coordinate.hpp"
#include "core/move.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace penguins {

//! A penguin standing on the board.
struct Penguin {
	HexCoordinate coordinate;
	TeamEnum team;

	bool operator==(const Penguin&) const = default;
};

//! One cell of the board.
struct Field {
	unsigned fish{0u};              //!< Fish left on the field. 0 once harvested (or a hole).
	std::optional<Penguin> penguin; //!< Penguin standing here, if any.

	bool isOccupied() const {
		return penguin.has_value();
	}

	bool operator==(const Field&) const = default;
};

//! Immutable ice floe of width x height fields.
//! \note Fields are stored row-major and addressed by hex coordinate.
class Board {
public:
	//! \param fields Row-major list of width*height fields.
	Board(std::size_t width, std::size_t height, std::vector<Field> fields);

	std::size_t width() const;
	std::size_t height() const;

	bool isValid(HexCoordinate c) const;             //!< True if the coordinate addresses a field on this board.
	const Field& getField(HexCoordinate c) const;    //!< Get the field at a valid coordinate.
	std::vector<Penguin> getTeamsPenguins(TeamEnum team) const;

	//! All slides the team's penguin at \p c can make. Empty if the team has no penguin there.
	std::vector<Move> possibleSlidesFrom(HexCoordinate c, TeamEnum team) const;

	//! Returns the board after the move: destination harvested and occupied, source vacated.
	//! \note Does not check legality. GameState validates before calling.
	Board move(const Move& move) const;

	bool operator==(const Board&) const = default;

private:
	std::size_t index(HexCoordinate c) const;

	//! Field that can be landed on by a slide.
	bool isPassable(HexCoordinate c) const;

private:
	std::size_t m_width{0u};      //!< Number of columns.
	std::size_t m_height{0u};     //!< Number of rows.
	std::vector<Field> m_fields{}; //!< Board data.
};

} // namespace penguins
