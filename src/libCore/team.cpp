#include "core/team.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace penguins {

Team::Team(const TeamEnum name) : name{name} {
}

void Team::recordMove(const Move& move, const unsigned harvested) {
	const auto from = move.from();
	auto it         = penguins.end();
	if (from) {
		it = std::find_if(penguins.begin(), penguins.end(), [&](const Penguin& p) { return p.coordinate == *from; });
	}

	if (it == penguins.end() && penguins.size() >= MAX_PENGUINS) {
		throw std::length_error(std::format("Team {} already placed all penguins: {}", toString(name), move.toString()));
	}

	moves.push_back(move);
	if (it != penguins.end()) {
		it->coordinate = move.to();
	} else {
		penguins.push_back(Penguin{.coordinate = move.to(), .team = name});
	}

	fish += harvested;
}

} // namespace penguins
