#include "core/gameState.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace penguins {

InvalidMove::InvalidMove(const Move& move) : std::runtime_error(std::format("Invalid move attempted: {}", move.toString())), m_move{move} {
}

const Move& InvalidMove::move() const {
	return m_move;
}

GameState::GameState(Board board, const unsigned turn, Team firstTeam, Team secondTeam, std::optional<Move> lastMove)
    : m_board{std::move(board)}, m_turn{turn}, m_firstTeam{std::move(firstTeam)}, m_secondTeam{std::move(secondTeam)}, m_lastMove{std::move(lastMove)} {
}

const Board& GameState::board() const {
	return m_board;
}

unsigned GameState::turn() const {
	return m_turn;
}

unsigned GameState::round() const {
	return (m_turn + 1u) / 2u;
}

const Team& GameState::firstTeam() const {
	return m_firstTeam;
}

const Team& GameState::secondTeam() const {
	return m_secondTeam;
}

const std::optional<Move>& GameState::lastMove() const {
	return m_lastMove;
}

const Team* GameState::currentTeam() const {
	return currentTeamFromTurn(m_turn);
}

const Team* GameState::currentTeamFromTurn(const unsigned turn) const {
	const bool firstCanMove  = !possibleMovesFor(m_firstTeam).empty();
	const bool secondCanMove = !possibleMovesFor(m_secondTeam).empty();

	// A team without a legal move forfeits its turn.
	if (turn % 2u == 0u) {
		if (firstCanMove)
			return &m_firstTeam;
		if (secondCanMove)
			return &m_secondTeam;
	} else {
		if (secondCanMove)
			return &m_secondTeam;
		if (firstCanMove)
			return &m_firstTeam;
	}
	return nullptr;
}

const Team* GameState::otherTeam() const {
	const auto* current = currentTeam();
	return current ? &opponent(*current) : nullptr;
}

const Team& GameState::opponent(const Team& team) const {
	return team.name == m_firstTeam.name ? m_secondTeam : m_firstTeam;
}

const Team* GameState::opponent() const {
	return otherTeam();
}

std::vector<Penguin> GameState::currentPenguins() const {
	const auto* current = currentTeam();
	return current ? m_board.getTeamsPenguins(current->name) : std::vector<Penguin>{};
}

std::vector<Move> GameState::possibleMoves() const {
	const auto* current = currentTeam();
	return current ? possibleMovesFor(*current) : std::vector<Move>{};
}

std::vector<Move> GameState::possibleMovesFor(const Team& team) const {
	std::vector<Move> moves;

	const auto penguins = m_board.getTeamsPenguins(team.name);
	if (penguins.size() < MAX_PENGUINS) {
		// Placement phase: any free field with exactly one fish.
		for (int x = 0; x < static_cast<int>(m_board.width()); ++x) {
			for (int y = 0; y < static_cast<int>(m_board.height()); ++y) {
				const auto c      = CartesianCoordinate{x, y}.toHex();
				const auto& field = m_board.getField(c);
				if (!field.isOccupied() && field.fish == 1u) {
					moves.emplace_back(team.name, Place{.to = c});
				}
			}
		}
	} else {
		for (const auto& penguin: penguins) {
			auto slides = m_board.possibleSlidesFrom(penguin.coordinate, team.name);
			moves.insert(moves.end(), slides.begin(), slides.end());
		}
	}
	return moves;
}

bool GameState::isValidMove(const Move& move) const {
	const auto* current = currentTeam();
	return current && isValidMoveFor(*current, move);
}

bool GameState::isValidMoveFor(const Team& team, const Move& move) const {
	if (move.team() != team.name) {
		return false;
	}
	const auto moves = possibleMovesFor(team);
	return std::find(moves.begin(), moves.end(), move) != moves.end();
}

GameState GameState::performMove(const Move& move) const {
	const auto* current = currentTeam();
	if (!current || !isValidMoveFor(*current, move)) {
		Logger().Log(Logging::LogLevel::Error, std::format("Performed invalid move while simulating: {}", move.toString()));
		throw InvalidMove(move);
	}

	const auto harvested = m_board.getField(move.to()).fish;
	Board nextBoard      = m_board.move(move);

	// Copies only. Nothing below touches this state.
	Team nextFirst  = m_firstTeam;
	Team nextSecond = m_secondTeam;

	auto& mover = nextFirst.name == current->name ? nextFirst : nextSecond;
	mover.recordMove(move, harvested);

	return GameState{std::move(nextBoard), m_turn + 1u, std::move(nextFirst), std::move(nextSecond), move};
}

static std::string toString(const Team& team) {
	return std::format("Team({}, fish={}, penguins={}, moves={})", penguins::toString(team.name), team.fish, team.penguins.size(), team.moves.size());
}

std::string GameState::toString() const {
	const auto* current = currentTeam();
	return std::format("GameState(turn={}, round={}, first_team={}, second_team={}, last_move={}, current_team={})", m_turn, round(),
	                   penguins::toString(m_firstTeam), penguins::toString(m_secondTeam), m_lastMove ? m_lastMove->toString() : "None",
	                   current ? penguins::toString(current->name) : "None");
}

} // namespace penguins
