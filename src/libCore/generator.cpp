#include "core/generator.hpp"
#include "core/types.hpp"

#include <algorithm>
#include <cassert>
#include <random>
#include <utility>
#include <vector>

namespace penguins {

Board generateBoard(const uint64_t seed, const std::size_t width, const std::size_t height) {
	const auto size = width * height;
	assert(size >= 2u * MAX_PENGUINS);

	std::mt19937_64 rng(seed);
	std::discrete_distribution<unsigned> fishDist({1.0, 8.0, 6.0, 4.0, 3.0}); //!< Weights for 0-4 fish.
	std::uniform_int_distribution<std::size_t> fieldDist(0u, (size - 1u) / 2u);

	// Field i mirrors field size-1-i.
	std::vector<unsigned> fish(size, 0u);
	for (std::size_t i = 0; i <= (size - 1u) / 2u; ++i) {
		fish[i] = fish[size - 1u - i] = fishDist(rng);
	}

	auto singles = static_cast<std::size_t>(std::count(fish.begin(), fish.end(), 1u));
	while (singles < 2u * MAX_PENGUINS) {
		const auto i = fieldDist(rng);
		if (fish[i] == 1u) {
			continue;
		}
		fish[i] = fish[size - 1u - i] = 1u;
		singles += (i == size - 1u - i) ? 1u : 2u;
	}

	std::vector<Field> fields;
	fields.reserve(size);
	for (const auto count: fish) {
		fields.push_back(Field{.fish = count, .penguin = std::nullopt});
	}
	return Board{width, height, std::move(fields)};
}

} // namespace penguins
