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


#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "nqgif.h"

namespace {

ChunkyBitmap Load(const std::string &data)
{
	std::istringstream stream(data, std::ios_base::in | std::ios_base::binary);
	return LoadPPM(stream);
}

void ExpectPixel(const ChunkyBitmap &bitmap, int x, int y, int r, int g, int b)
{
	const uint8_t *p = bitmap.Pixels + y * bitmap.Pitch + x * 4;
	EXPECT_EQ(r, p[0]) << x << "," << y;
	EXPECT_EQ(g, p[1]) << x << "," << y;
	EXPECT_EQ(b, p[2]) << x << "," << y;
	EXPECT_EQ(0xFF, p[3]) << x << "," << y;
}

} // namespace

TEST(LoadPPM, Binary)
{
	std::string data = "P6\n2 2\n255\n";
	const char raster[] = { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12 };
	data.append(raster, sizeof(raster));
	ChunkyBitmap bitmap = Load(data);
	ASSERT_FALSE(bitmap.IsEmpty());
	EXPECT_EQ(2, bitmap.Width);
	EXPECT_EQ(2, bitmap.Height);
	EXPECT_EQ(4, bitmap.BytesPerPixel);
	ExpectPixel(bitmap, 0, 0, 1, 2, 3);
	ExpectPixel(bitmap, 1, 0, 4, 5, 6);
	ExpectPixel(bitmap, 0, 1, 7, 8, 9);
	ExpectPixel(bitmap, 1, 1, 10, 11, 12);
}

TEST(LoadPPM, BinaryRasterMayStartWithWhitespaceByte)
{
	// The raster's first sample is 0x0A, which must not be eaten as header space.
	std::string data = "P6 1 1 255\n";
	data += "\n\x20\x09";
	ChunkyBitmap bitmap = Load(data);
	ASSERT_FALSE(bitmap.IsEmpty());
	ExpectPixel(bitmap, 0, 0, 10, 32, 9);
}

TEST(LoadPPM, BinarySixteenBit)
{
	std::string data = "P6\n2 1\n65535\n";
	const unsigned char raster[] = { 0xFF, 0xFF, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0xFF, 0xFE };
	data.append(reinterpret_cast<const char *>(raster), sizeof(raster));
	ChunkyBitmap bitmap = Load(data);
	ASSERT_FALSE(bitmap.IsEmpty());
	ExpectPixel(bitmap, 0, 0, 255, 128, 0);
	ExpectPixel(bitmap, 1, 0, 0, 1, 255);
}

TEST(LoadPPM, ASCIIWithComments)
{
	ChunkyBitmap bitmap = Load(
		"P3\n"
		"# made by hand\n"
		"3 # width\n"
		"1\n"
		"15\n"
		"15 0 7\n"
		"0 15 0 # green\n"
		"  3\t3\n3\n");
	ASSERT_FALSE(bitmap.IsEmpty());
	EXPECT_EQ(3, bitmap.Width);
	EXPECT_EQ(1, bitmap.Height);
	ExpectPixel(bitmap, 0, 0, 255, 0, 119);
	ExpectPixel(bitmap, 1, 0, 0, 255, 0);
	ExpectPixel(bitmap, 2, 0, 51, 51, 51);
}

TEST(LoadPPM, ClampsSamplesAboveMaxval)
{
	ChunkyBitmap bitmap = Load("P3 1 1 100 100 200 0");
	ASSERT_FALSE(bitmap.IsEmpty());
	ExpectPixel(bitmap, 0, 0, 255, 255, 0);
}

TEST(LoadPPM, RejectsOtherFormats)
{
	EXPECT_TRUE(Load("").IsEmpty());
	EXPECT_TRUE(Load("P5\n1 1\n255\nx").IsEmpty());
	EXPECT_TRUE(Load("GIF89a").IsEmpty());
}

TEST(LoadPPM, RejectsBadHeader)
{
	EXPECT_TRUE(Load("P3\n0 4\n255\n").IsEmpty());
	EXPECT_TRUE(Load("P3\n4\n").IsEmpty());
	EXPECT_TRUE(Load("P3\n1 1\n0\n0 0 0").IsEmpty());
	EXPECT_TRUE(Load("P3\n1 1\n65536\n0 0 0").IsEmpty());
	EXPECT_TRUE(Load("P3\n99999999999 1\n255\n0 0 0").IsEmpty());
	// Rejected from the header alone, before any pixel storage is set aside.
	EXPECT_TRUE(Load("P6\n60000 60000\n255\n").IsEmpty());
	EXPECT_TRUE(Load("P3\n2147483647 2147483647\n255\n").IsEmpty());
	EXPECT_TRUE(Load("P6\n1 1\n255x\x01\x02\x03").IsEmpty());
}

TEST(LoadPPM, RejectsTruncatedRaster)
{
	EXPECT_TRUE(Load("P3\n2 1\n255\n1 2 3 4 5").IsEmpty());
	EXPECT_TRUE(Load("P3\n1 1\n255\n1 two 3").IsEmpty());
	std::string data = "P6\n2 2\n255\n";
	data.append(11, '\x01');
	EXPECT_TRUE(Load(data).IsEmpty());
}
