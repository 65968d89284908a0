#pragma once

#include "core/board.hpp"

#include <cstddef>
#include <cstdint>

namespace penguins {

//! Generate a random, point symmetric starting board. Same seed, same board.
//! \note Guarantees enough single fish fields for both teams to place all penguins.
Board generateBoard(uint64_t seed, std::size_t width = 8u, std::size_t height = 8u);

} // namespace penguins
