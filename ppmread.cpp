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

#include <cctype>
#include <climits>
#include "nqgif.h"

// Skips whitespace and # comments between header fields.
static void SkipSpace(std::istream &file)
{
	int c;
	while ((c = file.peek()) != EOF)
	{
		if (c == '#')
		{
			while ((c = file.get()) != EOF && c != '\n' && c != '\r')
			{
			}
		}
		else if (isspace(c))
		{
			file.get();
		}
		else
		{
			break;
		}
	}
}

// Reads one unsigned decimal header field. Returns -1 if there isn't one.
static int ReadNumber(std::istream &file)
{
	SkipSpace(file);
	int c = file.peek();
	if (c == EOF || !isdigit(c))
	{
		return -1;
	}
	long val = 0;
	while ((c = file.peek()) != EOF && isdigit(c))
	{
		val = val * 10 + (file.get() - '0');
		if (val > INT_MAX / 10)
		{
			return -1;
		}
	}
	return (int)val;
}

// Scale a sample in [0,maxval] to [0,255], rounding to nearest.
static inline uint8_t ScaleSample(unsigned int val, unsigned int maxval)
{
	if (val > maxval) val = maxval;
	return maxval == 255 ? (uint8_t)val : (uint8_t)((val * 255 + maxval / 2) / maxval);
}

static bool ReadBinary(std::istream &file, ChunkyBitmap &bitmap, unsigned int maxval)
{
	const int bytespersample = maxval > 255 ? 2 : 1;
	std::vector<uint8_t> row((size_t)bitmap.Width * 3 * bytespersample);

	for (int y = 0; y < bitmap.Height; ++y)
	{
		if (!file.read(reinterpret_cast<char *>(row.data()), row.size()))
		{
			fprintf(stderr, "Only read %llu of %zu bytes in row %d\n", (unsigned long long)file.gcount(), row.size(), y);
			return false;
		}
		const uint8_t *src = row.data();
		uint8_t *dest = bitmap.Pixels + (size_t)y * bitmap.Pitch;
		for (int x = 0; x < bitmap.Width; ++x, dest += 4)
		{
			for (int i = 0; i < 3; ++i)
			{
				unsigned int val = *src++;
				if (bytespersample == 2)
				{ // Wide samples are stored most significant byte first.
					val = (val << 8) | *src++;
				}
				dest[i] = ScaleSample(val, maxval);
			}
			dest[3] = 0xFF;
		}
	}
	return true;
}

static bool ReadASCII(std::istream &file, ChunkyBitmap &bitmap, unsigned int maxval)
{
	for (int y = 0; y < bitmap.Height; ++y)
	{
		uint8_t *dest = bitmap.Pixels + (size_t)y * bitmap.Pitch;
		for (int x = 0; x < bitmap.Width; ++x, dest += 4)
		{
			for (int i = 0; i < 3; ++i)
			{
				int val = ReadNumber(file);
				if (val < 0)
				{
					fprintf(stderr, "Missing sample at %d,%d\n", x, y);
					return false;
				}
				dest[i] = ScaleSample(val, maxval);
			}
			dest[3] = 0xFF;
		}
	}
	return true;
}

ChunkyBitmap LoadPPM(std::istream &file)
{
	char magic[2];

	if (!file.read(magic, 2) || magic[0] != 'P' || (magic[1] != '3' && magic[1] != '6'))
	{
		fprintf(stderr, "Not a PPM pixmap (expected P3 or P6)\n");
		return {};
	}
	int width = ReadNumber(file);
	int height = ReadNumber(file);
	int maxval = ReadNumber(file);
	if (width <= 0 || height <= 0)
	{
		fprintf(stderr, "Invalid PPM dimensions\n");
		return {};
	}
	if (maxval <= 0 || maxval > 65535)
	{
		fprintf(stderr, "Invalid PPM maxval %d\n", maxval);
		return {};
	}
	// Checked before allocating, so a short header can't ask for gigabytes.
	if ((size_t)width * height * 4 > INT_MAX)
	{
		fprintf(stderr, "PPM dimensions %dx%d are too large\n", width, height);
		return {};
	}

	ChunkyBitmap bitmap(width, height, 4);
	bool succ;
	if (magic[1] == '6')
	{
		// Exactly one whitespace character separates the header from the raster.
		if (!isspace(file.get()))
		{
			fprintf(stderr, "Malformed PPM header\n");
			return {};
		}
		succ = ReadBinary(file, bitmap, maxval);
	}
	else
	{
		succ = ReadASCII(file, bitmap, maxval);
	}
	if (!succ)
	{
		return {};
	}
	return bitmap;
}
