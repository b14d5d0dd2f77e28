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

#include <array>
#include <algorithm>
#include <climits>
#include <cstring>
#include <stdexcept>
#include "nqgif.h"

ChunkyBitmap::ChunkyBitmap(int w, int h, int bpp)
{
	Alloc(w, h, bpp);
}

void ChunkyBitmap::Alloc(int w, int h, int bpp)
{
	if (w <= 0 || h <= 0)
	{
		throw std::invalid_argument("Bitmap dimensions must be positive");
	}
	if (bpp != 1 && bpp != 4)
	{
		throw std::invalid_argument("Bitmap must have 1 or 4 bytes per pixel");
	}
	if ((size_t)w * h * bpp > INT_MAX)
	{
		throw std::invalid_argument("Bitmap is too large");
	}
	Width = w;
	Height = h;
	BytesPerPixel = bpp;
	Pitch = Width * BytesPerPixel;
	Pixels = new uint8_t[(size_t)Pitch * Height];
	memset(Pixels, 0, (size_t)Pitch * Height);
}

ChunkyBitmap::~ChunkyBitmap()
{
	delete[] Pixels;
}

ChunkyBitmap::ChunkyBitmap(const ChunkyBitmap &o)
	: Width(o.Width), Height(o.Height), Pitch(o.Pitch),
	  BytesPerPixel(o.BytesPerPixel)
{
	if (o.Pixels != nullptr)
	{
		Pixels = new uint8_t[(size_t)Pitch * Height];
		memcpy(Pixels, o.Pixels, (size_t)Pitch * Height);
	}
}

ChunkyBitmap::ChunkyBitmap(ChunkyBitmap &&o) noexcept
	: Width(o.Width), Height(o.Height), Pitch(o.Pitch),
	  BytesPerPixel(o.BytesPerPixel), Pixels(o.Pixels)
{
	o.Clear(false);
}

ChunkyBitmap &ChunkyBitmap::operator=(ChunkyBitmap &&o) noexcept
{
	if (&o != this)
	{
		delete[] Pixels;
		Width = o.Width;
		Height = o.Height;
		Pitch = o.Pitch;
		Pixels = o.Pixels;
		BytesPerPixel = o.BytesPerPixel;
		o.Clear(false);
	}
	return *this;
}

bool ChunkyBitmap::operator==(const ChunkyBitmap &o) const noexcept
{
	if (&o == this) return true;
	if (Width != o.Width || Height != o.Height || Pitch != o.Pitch || BytesPerPixel != o.BytesPerPixel)
		return false;
	if (Pixels == nullptr || o.Pixels == nullptr)
		return Pixels == o.Pixels;
	return 0 == memcmp(Pixels, o.Pixels, (size_t)Pitch * Height);
}

void ChunkyBitmap::Clear(bool release) noexcept
{
	if (release)
	{
		delete[] Pixels;
	}
	Pixels = nullptr;
	Width = 0;
	Height = 0;
	Pitch = 0;
	BytesPerPixel = 0;
}

// For 32-bit bitmaps, color is stored as-is, so bytes land in memory order.
void ChunkyBitmap::SetSolidColor(uint32_t color) noexcept
{
	if (Pixels != nullptr)
	{
		if (BytesPerPixel == 1)
		{
			memset(Pixels, (uint8_t)color, (size_t)Width * Height);
		}
		else
		{
			std::fill_n(reinterpret_cast<uint32_t *>(Pixels), (size_t)Width * Height, color);
		}
	}
}

static const ChunkyBitmap::Diffuser
FloydSteinberg[] = {
	{ 28672, { {1, 0} } },								// 7/16
	{ 12288, { {-1, 1} } },								// 3/16
	{ 20480, { {0, 1} } },								// 5/16
	{  4096, { {1, 1} } },								// 1/16
	{ 0 } },

JarvisJudiceNinke[] = {
	{ 9557, { {1, 0}, {0, 1} } },						// 7/48
	{ 6826, { {2, 0}, {-1, 1}, {1, 1}, {0, 2} } },		// 5/48
	{ 4096, { {-2, 1}, {2, 1}, {-1, 2}, {1, 2} } },		// 3/48
	{ 1365, { {-2, 2}, {2, 2} } },						// 1/48
	{ 0 } },

Stucki[] = {
	{ 12483, { {1, 0}, {0, 1} } },						// 8/42
	{  6241, { {2, 0}, {-1, 1}, {1, 1}, {0, 2} } },		// 4/42
	{  3120, { {-2, 1}, {2, 1}, {-1, 2}, {1, 2} } },	// 2/42
	{  1560, { {-2, 2}, {2, 2 } } },					// 1/42
	{ 0 } },

Atkinson[] = {
	{ 8192, { {1, 0}, {2, 0}, {-1, 1}, {0, 1}, {1, 1}, {0, 2} } },	// 1/8
	{ 0 } },

Burkes[] = {
	{ 16384, { {1, 0}, {0, 1} } },						// 8/32
	{  8192, { {2, 0}, {-1, 1}, {1, 1} } },				// 4/32
	{  4096, { {-2, 1}, {2, 1} } },						// 2/32
	{ 0 } },

Sierra3[] = {
	{ 10240, {{1, 0}, {0, 1}} },						// 5/32
	{  8192, {{-1,1}, {1, 1}} },						// 4/32
	{  6144, {{2, 0}, {0, 2}} },						// 3/32
	{  4096, {{-2, 1}, {2, 1}, {-1, 2}, {1, 2}} },		// 2/32
	{ 0 } },

Sierra2[] = {
	{ 16384, {{1, 0}} },								// 4/16
	{ 12288, {{2, 0}, {0, 1}} },						// 3/16
	{  8192, {{-1, 1}, {1, 1}} },						// 2/16
	{  4096, {{-2, 1}, {2, 1}} },						// 1/16
	{ 0 } },

SierraLite[] = {
	{ 32768, {{1, 0}} },								// 2/4
	{ 16384, {{-1, 1}, {0, 1}} },						// 1/4
	{ 0 } }
;

static const ChunkyBitmap::Diffuser *const ErrorDiffusionKernels[] = {
	FloydSteinberg,
	JarvisJudiceNinke,
	Stucki,
	Burkes,
	Atkinson,
	Sierra3,
	Sierra2,
	SierraLite
};

// Turns rows of an RGBA bitmap into rows of palette indices.
class Palettizer
{
public:
	Palettizer(const ChunkyBitmap &bitmap, const Palette &pal, const Quantizer *matcher)
		: Bitmap(bitmap), Pal(pal), Matcher(matcher) {}
	virtual ~Palettizer() {}
	virtual void GetPixels(uint8_t *dest, int y) = 0;

protected:
	const ChunkyBitmap &Bitmap;
	const Palette &Pal;
	const Quantizer *Matcher;

	int Match(int r, int g, int b) const
	{
		return Matcher != nullptr ? Matcher->MapColor(r, g, b) : Pal.NearestColor(r, g, b);
	}
};

class NoDitherPalettizer : public Palettizer
{
public:
	using Palettizer::Palettizer;
	void GetPixels(uint8_t *dest, int y) override;
};

void NoDitherPalettizer::GetPixels(uint8_t *dest, int y)
{
	const uint8_t *src = Bitmap.Pixels + (size_t)y * Bitmap.Pitch;
	for (int x = Bitmap.Width; x > 0; --x, src += 4)
	{
		*dest++ = Match(src[0], src[1], src[2]);
	}
}

class ErrorDiffusionPalettizer : public Palettizer
{
public:
	ErrorDiffusionPalettizer(const ChunkyBitmap &bitmap, const Palette &pal, const Quantizer *matcher,
		const ChunkyBitmap::Diffuser *kernel);
	void GetPixels(uint8_t *dest, int y) override;

protected:
	void NextRow();

	const ChunkyBitmap::Diffuser *Kernel;

	// None of the kernels reach more than two rows down, so three rows of
	// error are enough. Error is stored as 16.16 fixed point, so it can be
	// applied to the output color with just a shift.
	std::vector<std::array<int, 3>> Error[3];
};

ErrorDiffusionPalettizer::ErrorDiffusionPalettizer(const ChunkyBitmap &bitmap, const Palette &pal,
	const Quantizer *matcher, const ChunkyBitmap::Diffuser *kernel)
	: Palettizer(bitmap, pal, matcher), Kernel(kernel)
{
	for (auto &arr : Error)
	{
		arr.resize(bitmap.Width);
	}
}

// Rows are always produced top to bottom, so the error window only ever
// slides down by one.
void ErrorDiffusionPalettizer::NextRow()
{
	Error[0].swap(Error[1]);
	Error[1].swap(Error[2]);
	std::fill(Error[2].begin(), Error[2].end(), std::array<int, 3>());
}

void ErrorDiffusionPalettizer::GetPixels(uint8_t *dest, int y)
{
	const uint8_t *src = Bitmap.Pixels + (size_t)y * Bitmap.Pitch;
	for (int x = 0; x < Bitmap.Width; ++x, src += 4)
	{
		// The combined color must be clamped, or "super-black" and
		// "super-white" targets diffuse speckles into flat areas.
		int r = std::clamp(src[0] + (Error[0][x][0] >> 16), 0, 255);
		int g = std::clamp(src[1] + (Error[0][x][1] >> 16), 0, 255);
		int b = std::clamp(src[2] + (Error[0][x][2] >> 16), 0, 255);
		int c = Match(r, g, b);
		dest[x] = c;

		// Diffuse the difference between what we wanted and what we got.
		r -= Pal[c].red;
		g -= Pal[c].green;
		b -= Pal[c].blue;
		for (const ChunkyBitmap::Diffuser *desc = Kernel; desc->weight != 0; ++desc)
		{
			int rw = r * desc->weight;
			int gw = g * desc->weight;
			int bw = b * desc->weight;
			for (size_t j = 0; j < countof(desc->to) && (desc->to[j].x | desc->to[j].y); ++j)
			{
				int xx = x + desc->to[j].x;
				if (xx >= 0 && xx < Bitmap.Width)
				{
					Error[desc->to[j].y][xx][0] += rw;
					Error[desc->to[j].y][xx][1] += gw;
					Error[desc->to[j].y][xx][2] += bw;
				}
			}
		}
	}
	NextRow();
}

ChunkyBitmap ChunkyBitmap::RGBtoPalette(const Palette &pal, int dithermode, const Quantizer *matcher) const
{
	if (BytesPerPixel != 4)
	{
		throw std::invalid_argument("RGBtoPalette needs a 32-bit RGBA bitmap");
	}
	if (pal.empty())
	{
		throw std::invalid_argument("RGBtoPalette needs a palette");
	}
	ChunkyBitmap out(Width, Height);
	std::unique_ptr<Palettizer> palettizer;

	if (dithermode <= 0 || dithermode > (int)countof(ErrorDiffusionKernels))
	{
		palettizer = std::make_unique<NoDitherPalettizer>(*this, pal, matcher);
	}
	else
	{
		palettizer = std::make_unique<ErrorDiffusionPalettizer>(*this, pal, matcher,
			ErrorDiffusionKernels[dithermode - 1]);
	}
	for (int y = 0; y < Height; ++y)
	{
		palettizer->GetPixels(out.Pixels + (size_t)y * out.Pitch, y);
	}
	return out;
}
