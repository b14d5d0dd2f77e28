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

int _tmain(int argc, _TCHAR* argv[])
{
	return RunCommandLine(argc, argv);
}

#if defined(__linux__) || defined(__MACH__)
int main(int argc, char *argv[])
{
	return _tmain(argc, argv);
}
#endif
