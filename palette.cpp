/* This file is part of nqgif.
**
** Copyright 2015-2019 - Marisa Heit
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

#include <algorithm>
#include <climits>
#include <cstring>
#include <errno.h>
#include "nqgif.h"

// Sets NumBits according to the size of the palette.
void Palette::CalcBits()
{
	int bits = 0;
	while ((size_t)1 << bits < Pal.size())
		bits++;
	NumBits = bits;
}

// Returns a version of the palette extended to the next power of 2, which
// is the only size a GIF color table can have.
Palette Palette::Extend() const
{
	if (empty())
	{
		return {};
	}

	uint8_t p = 1;
	size_t numdest = 2, i;
	while (numdest < Pal.size() && p < 8)
		++p, numdest *= 2;

	std::vector<ColorRegister> dest(numdest);
	for (i = 0; i < std::min(Pal.size(), numdest); ++i)
	{
		dest[i] = Pal[i];
	}
	// Pad with a gray ramp
	for (; i < numdest; ++i)
	{
		dest[i].blue = dest[i].green = dest[i].red = uint8_t((i * 255) >> p);
	}

	return Palette(std::move(dest), p);
}

int Palette::NearestColor(int r, int g, int b) const
{
	int bestcolor = 0;
	int bestdist = INT_MAX;

	for (int color = 0; color < (int)Pal.size(); color++)
	{
		int rmean = (r + Pal[color].red) / 2;
		int x = r - Pal[color].red;
		int y = g - Pal[color].green;
		int z = b - Pal[color].blue;
		// Thiadmer Riemersma's color distance equation from
		// https://www.compuphase.com/cmetric.htm
		int dist = (512 + rmean) * x * x + 1024 * y * y + (767 - rmean) * z * z;
		if (dist < bestdist)
		{
			if (dist == 0)
				return color;

			bestdist = dist;
			bestcolor = color;
		}
	}
	return bestcolor;
}

bool Palette::WriteFile(const _TCHAR *filename) const
{
	FILE *file = _tfopen(filename, _T("w"));
	if (file == nullptr)
	{
		_ftprintf(stderr, _T("Could not open %s: %s\n"), filename, _tcserror(errno));
		return false;
	}
	bool succ = fprintf(file, "JASC-PAL\n0100\n%zu\n", Pal.size()) > 0;
	for (size_t i = 0; succ && i < Pal.size(); ++i)
	{
		succ = fprintf(file, "%d %d %d\n", Pal[i].red, Pal[i].green, Pal[i].blue) > 0;
	}
	if (fclose(file) != 0)
	{
		succ = false;
	}
	if (!succ)
	{
		_ftprintf(stderr, _T("Could not write to %s: %s\n"), filename, _tcserror(errno));
	}
	return succ;
}
