#include "core/notation.hpp"

#include <charconv>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

namespace penguins {

static constexpr std::string_view MOVE_PLACE = "place";
static constexpr std::string_view MOVE_SLIDE = "slide";
static constexpr std::string_view SLIDE_SEP  = "->";

static constexpr unsigned MAX_FISH = 4u;

static bool parseInt(std::string_view value, int& out) {
	if (value.empty()) {
		return false;
	}
	const auto* begin    = value.data();
	const auto* end      = value.data() + value.size();
	const auto [ptr, ec] = std::from_chars(begin, end, out);
	return ec == std::errc() && ptr == end;
}

//! Parse "(x,y)".
static std::optional<HexCoordinate> parseCoordinate(std::string_view value) {
	if (value.size() < 5u || value.front() != '(' || value.back() != ')') {
		return {};
	}
	value = value.substr(1u, value.size() - 2u);

	const auto commaPos = value.find(',');
	if (commaPos == std::string_view::npos) {
		return {};
	}

	HexCoordinate c{};
	if (!parseInt(value.substr(0, commaPos), c.x) || !parseInt(value.substr(commaPos + 1), c.y)) {
		return {};
	}
	return c;
}

static std::optional<TeamEnum> parseTeam(std::string_view value) {
	if (value == "ONE")
		return TeamEnum::One;
	if (value == "TWO")
		return TeamEnum::Two;
	return {};
}

static std::optional<Field> parseField(const std::string& token, const HexCoordinate c) {
	if (token.size() != 1u) {
		return {};
	}

	const char cell = token[0u];
	if (cell == 'A') {
		return Field{.fish = 0u, .penguin = Penguin{.coordinate = c, .team = TeamEnum::One}};
	}
	if (cell == 'B') {
		return Field{.fish = 0u, .penguin = Penguin{.coordinate = c, .team = TeamEnum::Two}};
	}
	if (cell >= '0' && cell <= static_cast<char>('0' + MAX_FISH)) {
		return Field{.fish = static_cast<unsigned>(cell - '0'), .penguin = std::nullopt};
	}
	return {};
}

std::optional<Board> boardFromString(const std::string& text) {
	std::vector<Field> fields;
	std::size_t width  = 0u;
	std::size_t height = 0u;

	std::istringstream rows(text);
	std::string row;
	while (std::getline(rows, row)) {
		std::istringstream cells(row);
		std::string token;
		std::size_t x = 0u;
		while (cells >> token) {
			const auto c     = CartesianCoordinate{static_cast<int>(x), static_cast<int>(height)}.toHex();
			const auto field = parseField(token, c);
			if (!field) {
				return {};
			}
			fields.push_back(*field);
			++x;
		}

		// Blank lines carry no row.
		if (x == 0u) {
			continue;
		}
		if (height == 0u) {
			width = x;
		} else if (x != width) {
			return {};
		}
		++height;
	}

	if (height == 0u) {
		return {};
	}

	Board board{width, height, std::move(fields)};
	if (board.getTeamsPenguins(TeamEnum::One).size() > MAX_PENGUINS || board.getTeamsPenguins(TeamEnum::Two).size() > MAX_PENGUINS) {
		return {};
	}
	return board;
}

std::string toString(const Board& board) {
	std::string out;
	for (int y = 0; y < static_cast<int>(board.height()); ++y) {
		if (y % 2 == 1) {
			out.push_back(' ');
		}
		for (int x = 0; x < static_cast<int>(board.width()); ++x) {
			if (x) {
				out.push_back(' ');
			}
			const auto& field = board.getField(CartesianCoordinate{x, y}.toHex());
			if (field.penguin) {
				out.push_back(field.penguin->team == TeamEnum::One ? 'A' : 'B');
			} else {
				out.push_back(static_cast<char>('0' + field.fish));
			}
		}
		out.push_back('\n');
	}
	return out;
}

std::optional<Move> moveFromString(const std::string& text) {
	// Expect "<TEAM> place (x,y)" or "<TEAM> slide (x,y)->(x,y)"
	std::istringstream in(text);
	std::string teamToken, kindToken, targetToken, rest;
	if (!(in >> teamToken >> kindToken >> targetToken) || (in >> rest)) {
		return {};
	}

	const auto team = parseTeam(teamToken);
	if (!team) {
		return {};
	}

	if (kindToken == MOVE_PLACE) {
		const auto to = parseCoordinate(targetToken);
		if (!to) {
			return {};
		}
		return Move{*team, Place{.to = *to}};
	}

	if (kindToken == MOVE_SLIDE) {
		const auto sepPos = targetToken.find(SLIDE_SEP);
		if (sepPos == std::string::npos) {
			return {};
		}
		const auto from = parseCoordinate(std::string_view{targetToken}.substr(0, sepPos));
		const auto to   = parseCoordinate(std::string_view{targetToken}.substr(sepPos + SLIDE_SEP.size()));
		if (!from || !to) {
			return {};
		}
		return Move{*team, Slide{.from = *from, .to = *to}};
	}

	// Invalid
	return {};
}

GameState initialState(Board board) {
	Team first{TeamEnum::One};
	Team second{TeamEnum::Two};
	first.penguins  = board.getTeamsPenguins(TeamEnum::One);
	second.penguins = board.getTeamsPenguins(TeamEnum::Two);

	return GameState{std::move(board), 0u, std::move(first), std::move(second), std::nullopt};
}

} // namespace penguins
