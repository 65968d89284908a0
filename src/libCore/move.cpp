#include "core/move.hpp"

#include <format>
#include <type_traits>
#include <utility>

namespace penguins {

Move::Move(const TeamEnum team, MoveAction action) : m_team{team}, m_action{std::move(action)} {
}

TeamEnum Move::team() const {
	return m_team;
}

const MoveAction& Move::action() const {
	return m_action;
}

HexCoordinate Move::to() const {
	return std::visit([](const auto& a) { return a.to; }, m_action);
}

std::optional<HexCoordinate> Move::from() const {
	if (const auto* slide = std::get_if<Slide>(&m_action)) {
		return slide->from;
	}
	return std::nullopt;
}

bool Move::isPlacement() const {
	return std::holds_alternative<Place>(m_action);
}

std::string Move::toString() const {
	return std::visit(
	        [this](const auto& a) {
		        using T = std::decay_t<decltype(a)>;

		        if constexpr (std::is_same_v<T, Place>) {
			        return std::format("{} place {}", penguins::toString(m_team), penguins::toString(a.to));
		        } else {
			        return std::format("{} slide {}->{}", penguins::toString(m_team), penguins::toString(a.from), penguins::toString(a.to));
		        }
	        },
	        m_action);
}

} // namespace penguins
