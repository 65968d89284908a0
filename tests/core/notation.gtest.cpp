#include "core/notation.hpp"

#include <gtest/gtest.h>

namespace penguins::gtest {

TEST(Notation, BoardFromString) {
	const auto board = boardFromString("1 2 0\n"
	                                   " A 4 B\n");
	ASSERT_TRUE(board.has_value());
	EXPECT_EQ(board->width(), 3u);
	EXPECT_EQ(board->height(), 2u);

	EXPECT_EQ(board->getField({0, 0}).fish, 1u);
	EXPECT_EQ(board->getField({2, 0}).fish, 2u);
	EXPECT_EQ(board->getField({4, 0}).fish, 0u);
	EXPECT_EQ(board->getField({3, 1}).fish, 4u);

	ASSERT_TRUE(board->getField({1, 1}).isOccupied());
	EXPECT_EQ(board->getField({1, 1}).penguin->team, TeamEnum::One);
	EXPECT_EQ(board->getField({1, 1}).penguin->coordinate, (HexCoordinate{1, 1}));
	ASSERT_TRUE(board->getField({5, 1}).isOccupied());
	EXPECT_EQ(board->getField({5, 1}).penguin->team, TeamEnum::Two);
}

TEST(Notation, BoardFromStringSkipsBlankLines) {
	const auto board = boardFromString("\n1 1\n\n 2 2\n\n");
	ASSERT_TRUE(board.has_value());
	EXPECT_EQ(board->height(), 2u);
}

TEST(Notation, BoardFromStringInvalid) {
	EXPECT_FALSE(boardFromString("").has_value());
	EXPECT_FALSE(boardFromString("1 2\n 3\n").has_value()); // Ragged rows
	EXPECT_FALSE(boardFromString("1 5\n").has_value());      // Too many fish
	EXPECT_FALSE(boardFromString("1 C\n").has_value());
	EXPECT_FALSE(boardFromString("12 1\n").has_value());
}

// A team never starts with more than MAX_PENGUINS penguins.
TEST(Notation, BoardFromStringTooManyPenguins) {
	EXPECT_FALSE(boardFromString("A A A A A\n").has_value());
	EXPECT_FALSE(boardFromString("B B B\n"
	                             " B 1 B\n").has_value());

	const auto full = boardFromString("A A A A\n"
	                                  " B B B B\n");
	ASSERT_TRUE(full.has_value());
	EXPECT_EQ(full->getTeamsPenguins(TeamEnum::One).size(), MAX_PENGUINS);
	EXPECT_EQ(full->getTeamsPenguins(TeamEnum::Two).size(), MAX_PENGUINS);
}

TEST(Notation, BoardToString) {
	const std::string text = "1 2 0\n"
	                         " A 4 B\n"
	                         "3 3 1\n";
	EXPECT_EQ(toString(boardFromString(text).value()), text);
}

TEST(Notation, MoveToString) {
	EXPECT_EQ((Move{TeamEnum::One, Place{{3, 1}}}).toString(), "ONE place (3,1)");
	EXPECT_EQ((Move{TeamEnum::Two, Slide{{3, 1}, {7, 1}}}).toString(), "TWO slide (3,1)->(7,1)");
}

TEST(Notation, MoveFromString) {
	const auto place = moveFromString("ONE place (3,1)");
	ASSERT_TRUE(place.has_value());
	EXPECT_EQ(*place, (Move{TeamEnum::One, Place{{3, 1}}}));
	EXPECT_FALSE(place->from().has_value());

	const auto slide = moveFromString("TWO slide (3,1)->(7,1)");
	ASSERT_TRUE(slide.has_value());
	EXPECT_EQ(*slide, (Move{TeamEnum::Two, Slide{{3, 1}, {7, 1}}}));
	EXPECT_EQ(slide->from(), (HexCoordinate{3, 1}));
}

TEST(Notation, MoveFromStringInvalid) {
	EXPECT_FALSE(moveFromString("").has_value());
	EXPECT_FALSE(moveFromString("THREE place (1,1)").has_value());
	EXPECT_FALSE(moveFromString("ONE jump (1,1)").has_value());
	EXPECT_FALSE(moveFromString("ONE place (1,)").has_value());
	EXPECT_FALSE(moveFromString("ONE place 1,1").has_value());
	EXPECT_FALSE(moveFromString("ONE slide (1,1)").has_value());
	EXPECT_FALSE(moveFromString("ONE slide (1,1)->(a,1)").has_value());
	EXPECT_FALSE(moveFromString("ONE place (1,1) extra").has_value());
}

TEST(Notation, InitialState) {
	const auto state = initialState(boardFromString("A 1 B\n 1 A 1\n").value());

	EXPECT_EQ(state.turn(), 0u);
	EXPECT_FALSE(state.lastMove().has_value());
	EXPECT_EQ(state.firstTeam().name, TeamEnum::One);
	EXPECT_EQ(state.secondTeam().name, TeamEnum::Two);
	EXPECT_EQ(state.firstTeam().penguins.size(), 2u);
	EXPECT_EQ(state.secondTeam().penguins.size(), 1u);
	EXPECT_EQ(state.firstTeam().fish, 0u);
	EXPECT_TRUE(state.firstTeam().moves.empty());
}

} // namespace penguins::gtest
