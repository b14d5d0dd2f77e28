/* This file is part of nqgif.
**
** Copyright 2026 - The nqgif contributors
**
** nqgif is free software : you can redistribute it and / or modify
** it under the terms of the GNU General Public License as published by
** the Free Software Foundation, either version 2 of the License, or
** (at your option) any later version.
**
** nqgif is distributed in the hope that it will be useful,
** but WITHOUT ANY WARRANTY; without even the implied warranty of
** MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.See the
** GNU General Public License for more details.
**
** You should have received a copy of the GNU General Public License
** along with nqgif. If not, see <http://www.gnu.org/licenses/>.
*/


#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "nqgif.h"

namespace {

Palette Make(size_t count)
{
	std::vector<ColorRegister> colors;
	for (size_t i = 0; i < count; ++i)
		colors.push_back(ColorRegister(int(i), int(i * 2 % 256), 255 - int(i)));
	return colors;
}

} // namespace

TEST(Palette, Bits)
{
	EXPECT_EQ(0, Palette().Bits());
	EXPECT_EQ(1, Make(2).Bits());
	EXPECT_EQ(2, Make(3).Bits());
	EXPECT_EQ(7, Make(100).Bits());
	EXPECT_EQ(8, Make(256).Bits());
}

TEST(Palette, ExtendPadsToPowerOfTwo)
{
	Palette pal = Make(5).Extend();
	ASSERT_EQ(8u, pal.size());
	EXPECT_EQ(3, pal.Bits());
	for (size_t i = 0; i < 5; ++i)
	{
		EXPECT_EQ(Make(5)[i], pal[i]);
	}
	for (size_t i = 5; i < 8; ++i)
	{
		uint8_t gray = uint8_t((i * 255) >> 3);
		EXPECT_EQ(ColorRegister(gray, gray, gray), pal[i]);
	}
}

TEST(Palette, ExtendKeepsFullTables)
{
	Palette full = Make(256);
	EXPECT_EQ(full, full.Extend());
	// GIF color tables hold at least two entries.
	EXPECT_EQ(2u, Make(1).Extend().size());
	EXPECT_TRUE(Palette().Extend().empty());
}

TEST(Palette, NearestColor)
{
	Palette pal(std::vector<ColorRegister>{ { 0, 0, 0 }, { 255, 255, 255 }, { 255, 0, 0 }, { 0, 128, 0 } });
	EXPECT_EQ(0, pal.NearestColor(0, 0, 0));
	EXPECT_EQ(1, pal.NearestColor(250, 250, 250));
	EXPECT_EQ(2, pal.NearestColor(200, 30, 20));
	EXPECT_EQ(3, pal.NearestColor(10, 120, 10));
	// Ties go to the earliest entry.
	Palette dup(std::vector<ColorRegister>{ { 9, 9, 9 }, { 9, 9, 9 } });
	EXPECT_EQ(0, dup.NearestColor(9, 9, 9));
}

TEST(Palette, WriteFile)
{
	std::string filename = testing::TempDir() + "nqgif_palette_test.pal";
	Palette pal(std::vector<ColorRegister>{ { 1, 2, 3 }, { 255, 128, 0 } });
	ASSERT_TRUE(pal.WriteFile(filename.c_str()));

	std::ifstream file(filename);
	std::stringstream contents;
	contents << file.rdbuf();
	file.close();
	remove(filename.c_str());
	EXPECT_EQ("JASC-PAL\n0100\n2\n1 2 3\n255 128 0\n", contents.str());
}

TEST(Palette, WriteFileReportsFailure)
{
	std::string filename = testing::TempDir() + "no/such/dir/out.pal";
	EXPECT_FALSE(Make(4).WriteFile(filename.c_str()));
}
