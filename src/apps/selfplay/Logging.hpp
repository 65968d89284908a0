#pragma once

#include "Logger/Logger.hpp"

namespace penguins::selfplay {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace penguins::selfplay
