#include "core/coordinate.hpp"

#include <gtest/gtest.h>

namespace penguins::gtest {

TEST(Coordinate, CartesianToHex) {
	EXPECT_EQ((CartesianCoordinate{0, 0}).toHex(), (HexCoordinate{0, 0}));
	EXPECT_EQ((CartesianCoordinate{3, 0}).toHex(), (HexCoordinate{6, 0}));
	EXPECT_EQ((CartesianCoordinate{0, 1}).toHex(), (HexCoordinate{1, 1}));
	EXPECT_EQ((CartesianCoordinate{3, 1}).toHex(), (HexCoordinate{7, 1}));
	EXPECT_EQ((CartesianCoordinate{2, 2}).toHex(), (HexCoordinate{4, 2}));
}

TEST(Coordinate, HexToCartesian) {
	EXPECT_EQ((HexCoordinate{0, 0}).toCartesian(), (CartesianCoordinate{0, 0}));
	EXPECT_EQ((HexCoordinate{7, 1}).toCartesian(), (CartesianCoordinate{3, 1}));
	EXPECT_EQ((HexCoordinate{14, 6}).toCartesian(), (CartesianCoordinate{7, 6}));
	EXPECT_EQ((HexCoordinate{15, 7}).toCartesian(), (CartesianCoordinate{7, 7}));
}

// Conversion is lossless for every field of a standard board.
TEST(Coordinate, ConversionIsInvertible) {
	for (int x = 0; x != 8; ++x) {
		for (int y = 0; y != 8; ++y) {
			const CartesianCoordinate c{x, y};
			EXPECT_EQ(c.toHex().toCartesian(), c);
		}
	}
}

TEST(Coordinate, Neighbors) {
	const HexCoordinate c{4, 2};
	EXPECT_EQ(c.neighbor(Direction::Left), (HexCoordinate{2, 2}));
	EXPECT_EQ(c.neighbor(Direction::Right), (HexCoordinate{6, 2}));
	EXPECT_EQ(c.neighbor(Direction::UpLeft), (HexCoordinate{3, 1}));
	EXPECT_EQ(c.neighbor(Direction::UpRight), (HexCoordinate{5, 1}));
	EXPECT_EQ(c.neighbor(Direction::DownLeft), (HexCoordinate{3, 3}));
	EXPECT_EQ(c.neighbor(Direction::DownRight), (HexCoordinate{5, 3}));
}

TEST(Coordinate, ToString) {
	EXPECT_EQ(toString(HexCoordinate{3, 1}), "(3,1)");
	EXPECT_EQ(toString(HexCoordinate{-1, 0}), "(-1,0)");
}

} // namespace penguins::gtest
