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

#include "nqgif.h"

// Replace the input's extension with .gif
void Opts::DefaultOutPathname()
{
	OutPathname = InPathname;

	// Strip off the existing extension if it's 4 or fewer characters.
	auto stop = OutPathname.find_last_of(_T('.'));
	if (stop != tstring::npos)
	{
		size_t extlen = OutPathname.size() - stop - 1;
		// "Real" extensions don't start with a space character
		if (extlen > 0 && extlen <= 4 && OutPathname[stop + 1] != _T(' ') &&
			OutPathname.find_first_of(_T("/\\"), stop) == tstring::npos)
		{
			OutPathname.resize(stop);
		}
	}
	OutPathname += _T(".gif");
}
