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

#pragma once

#include <stdint.h>
#include <stdlib.h>

#ifdef _WIN32
#include <tchar.h>

#ifdef __cplusplus
extern "C" {
#endif
	extern int opterr, optind, optopt;
	extern _TCHAR *optarg;
	extern int getopt(int argc, _TCHAR **argv, const char *optstring);
#ifdef __cplusplus
}
#endif

#else
// Same shims as the Windows TCHAR API, so the command line front end can
// be shared between platforms.
#define _TCHAR char
#define _T(x) x
#define _ftprintf fprintf
#define _tfopen fopen
#define _tcserror strerror
#define _ttoi atoi
#endif

#ifdef __cplusplus
#include <string>
typedef std::basic_string<_TCHAR> tstring;

template <typename T, std::size_t N>
constexpr std::size_t countof(T const (&)[N]) noexcept
{
	return N;
}

// GIF stores its multi-byte fields in little-endian order.
#if defined(__BIG_ENDIAN__) || (defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__)
inline uint16_t LittleShort(uint16_t x)
{
	return (uint16_t)((x >> 8) | (x << 8));
}
#else
inline uint16_t LittleShort(uint16_t x)
{
	return x;
}
#endif

#endif // __cplusplus
