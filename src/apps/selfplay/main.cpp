#include "Logging.hpp"

#include "core/gameState.hpp"
#include "core/generator.hpp"
#include "core/notation.hpp"

#include <charconv>
#include <cstdint>
#include <cstring>
#include <format>
#include <iostream>
#include <random>

using namespace penguins;

//! Picks a uniformly random legal move.
class RandomPlayer {
public:
	explicit RandomPlayer(uint64_t seed) : m_rng(seed) {
	}

	Move choose(const GameState& state) {
		const auto moves = state.possibleMoves();
		std::uniform_int_distribution<std::size_t> dist(0u, moves.size() - 1u);
		return moves[dist(m_rng)];
	}

private:
	std::mt19937_64 m_rng;
};

static bool parseSeed(const char* arg, uint64_t& seed) {
	const auto* end      = arg + std::strlen(arg);
	const auto [ptr, ec] = std::from_chars(arg, end, seed);
	return ec == std::errc() && ptr == end && ptr != arg;
}

int main(int argc, char** argv) {
	uint64_t seed = std::random_device{}();
	if (argc > 2 || (argc == 2 && !parseSeed(argv[1], seed))) {
		std::cerr << "Usage: penguins_selfplay [seed]\n";
		return 1;
	}

	auto logger = selfplay::Logger();
	logger.Log(Logging::LogLevel::Info, std::format("[Selfplay] Starting game with seed {}.", seed));

	auto state = initialState(generateBoard(seed));
	std::cout << toString(state.board()) << "\n";

	RandomPlayer first{seed + 1u};
	RandomPlayer second{seed + 2u};

	while (const auto* current = state.currentTeam()) {
		auto& player    = current->name == TeamEnum::One ? first : second;
		const auto move = player.choose(state);

		try {
			state = state.performMove(move);
		} catch (const InvalidMove& e) {
			logger.Log(Logging::LogLevel::Error, std::format("[Selfplay] {}", e.what()));
			return 1;
		}

		logger.Log(Logging::LogLevel::Info, std::format("[Selfplay] Turn {}: {}", state.turn(), move.toString()));
		std::cout << std::format("{:>3}: {}\n", state.turn(), move.toString());
	}

	const auto oneFish = state.firstTeam().fish;
	const auto twoFish = state.secondTeam().fish;
	std::cout << "\n" << toString(state.board()) << "\n";
	std::cout << std::format("ONE: {}  TWO: {}\n", oneFish, twoFish);

	const std::string result = oneFish == twoFish ? "Draw" : std::format("Winner: {}", oneFish > twoFish ? "ONE" : "TWO");
	std::cout << result << "\n";
	logger.Log(Logging::LogLevel::Info, std::format("[Selfplay] Game over after {} turns. {}", state.turn(), result));
	return 0;
}
