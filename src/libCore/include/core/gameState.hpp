#pragma once

#include "core/board.hpp"
#include "core/move.hpp"
#include "core/team.hpp"
#include "core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace penguins {

//! Thrown when a move is performed that is not legal for the team to move.
class InvalidMove : public std::runtime_error {
public:
	explicit InvalidMove(const Move& move);

	const Move& move() const; //!< The rejected move.

private:
	Move m_move;
};

//! Immutable snapshot of a game between two moves.
//! Performing a move never modifies the state it is called on, which allows searching
//! from a shared state on multiple threads.
class GameState {
public:
	GameState(Board board, unsigned turn, Team firstTeam, Team secondTeam, std::optional<Move> lastMove);

	const Board& board() const;
	unsigned turn() const;
	unsigned round() const; //!< Pair of turns, (turn + 1) / 2.
	const Team& firstTeam() const;
	const Team& secondTeam() const;
	const std::optional<Move>& lastMove() const;

	//! Team to move. Nullptr if neither team can move (game over).
	//! \note The pointer refers into this state and shares its lifetime.
	const Team* currentTeam() const;

	//! Team to move for a given turn number, skipping a team without legal moves.
	const Team* currentTeamFromTurn(unsigned turn) const;

	const Team* otherTeam() const;                  //!< Opponent of the current team. Nullptr if game over.
	const Team& opponent(const Team& team) const;   //!< The other team of this state.
	const Team* opponent() const;                   //!< Same as otherTeam().
	std::vector<Penguin> currentPenguins() const;   //!< Penguins of the current team on the board.

	std::vector<Move> possibleMoves() const;                   //!< Legal moves of the current team. Empty if game over.
	std::vector<Move> possibleMovesFor(const Team& team) const; //!< Legal moves of a given team.

	//! True if the move is legal and made by the team to move.
	bool isValidMove(const Move& move) const;

	//! Returns the state after the move.
	//! \throws InvalidMove if the move is not valid. This state stays untouched either way.
	GameState performMove(const Move& move) const;

	std::string toString() const;

	bool operator==(const GameState&) const = default;

private:
	bool isValidMoveFor(const Team& team, const Move& move) const;

private:
	Board m_board;
	unsigned m_turn{0u}; //!< Number of moves made so far.
	Team m_firstTeam;    //!< Team starting the game.
	Team m_secondTeam;
	std::optional<Move> m_lastMove;
};

} // namespace penguins
