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

#include <stdio.h>
#include <vector>
#include <iostream>
#include <memory>
#include "types.h"

class Quantizer;

struct ColorRegister {				/* size = 3 bytes			*/
	uint8_t red, green, blue;		/* color intensities 0..255 */
	ColorRegister() : red(0), green(0), blue(0) {}
	ColorRegister(int r, int g, int b) : red(r), green(g), blue(b) {}

	bool operator==(const ColorRegister &b) const noexcept
	{
		return red == b.red && green == b.green && blue == b.blue;
	}
	bool operator!=(const ColorRegister &b) const noexcept { return !(*this == b); }
};

class Palette
{
public:
	Palette() {}
	Palette(std::vector<ColorRegister> &&colors) : Pal(std::move(colors)) { CalcBits(); }
	Palette(const std::vector<ColorRegister> &colors) : Pal(colors) { CalcBits(); }
	ColorRegister &operator[](size_t i) { return Pal[i]; }
	const ColorRegister &operator[](size_t i) const { return Pal[i]; }
	bool operator!=(const Palette &o) const { return Pal != o.Pal; }
	bool operator==(const Palette &o) const { return Pal == o.Pal; }
	size_t size() const { return Pal.size(); }
	bool empty() const { return Pal.empty(); }
	int Bits() const { return NumBits; }

	// Return a palette extended to the nearest power of 2 length
	Palette Extend() const;

	// Find the palette entry most similar to the requested color.
	int NearestColor(int r, int g, int b) const;

	// Save as a JASC-PAL text file. Returns false if it couldn't be written.
	bool WriteFile(const _TCHAR *filename) const;

protected:
	Palette(std::vector<ColorRegister> &&colors, int numbits) : Pal(std::move(colors)), NumBits(numbits) {}

private:
	std::vector<ColorRegister> Pal;
	int NumBits = 0;	// # of bits needed to represent the maximum value in this palette

	void CalcBits();
};

class ChunkyBitmap
{
public:
	int Width = 0, Height = 0, Pitch = 0, BytesPerPixel = 0;
	uint8_t *Pixels = nullptr;

	ChunkyBitmap() {}
	ChunkyBitmap(int w, int h, int bpp = 1);
	ChunkyBitmap(const ChunkyBitmap &o);
	ChunkyBitmap(ChunkyBitmap &&o) noexcept;
	ChunkyBitmap &operator=(ChunkyBitmap &&o) noexcept;
	~ChunkyBitmap();

	bool operator==(const ChunkyBitmap &o) const noexcept;
	bool IsEmpty() const noexcept { return Pixels == nullptr; }
	void Clear(bool release=true) noexcept;
	void SetSolidColor(uint32_t color) noexcept;

	// Reduce an RGBA image to 8-bits. Colors are matched through matcher
	// when one is given, or with the palette's own search otherwise.
	ChunkyBitmap RGBtoPalette(const Palette &pal, int dithermode, const Quantizer *matcher = nullptr) const;

	// Describes an error diffusion kernel. An array of these, terminated with a
	// weight of 0, describes one kernel. Since a single weighting is often applied
	// to multiple pixels, this struct stores each weight once with a list of
	// pixels to add that weighted value to.
	struct Diffuser
	{
		uint16_t weight;		// .16 fixed point
		struct { int8_t x, y; } to[6];
	};

private:
	void Alloc(int w, int h, int bpp);
};

class Quantizer
{
public:
	virtual ~Quantizer();
	virtual void AddPixels(const ChunkyBitmap &bitmap);
	virtual void AddPixels(const uint8_t *rgba, size_t count) = 0;
	virtual Palette GetPalette() = 0;

	// Index into the palette from GetPalette() to use for this color.
	virtual int MapColor(int r, int g, int b) const = 0;
};

Quantizer *NewNeuQuant(int samplefac);

// Netpbm pixmaps (P3 and P6). Returns an empty bitmap on failure.
ChunkyBitmap LoadPPM(std::istream &file);

struct LogicalScreenDescriptor
{
	uint16_t Width;
	uint16_t Height;
	uint8_t Flags;
	uint8_t BkgColor;
	uint8_t AspectRatio;
};

struct ImageDescriptor
{
	uint16_t Left;
	uint16_t Top;
	uint16_t Width;
	uint16_t Height;
	uint8_t Flags;
};

void LZWCompress(std::vector<uint8_t> &vec, const ChunkyBitmap &chunky, uint8_t mincodesize);

class GIFWriter
{
public:
	GIFWriter(const tstring &filename);
	~GIFWriter();

	// Writes an 8-bit bitmap that uses pal. Returns true on success.
	bool Write(const ChunkyBitmap &chunky, const Palette &pal);

private:
	FILE *File = nullptr;
	tstring Filename;

	bool WriteHeader(const ChunkyBitmap &chunky, const Palette &pal);
	bool WriteImage(const ChunkyBitmap &chunky, int mincodesize);
	bool FinishFile();
	void BadWrite();
};

// Process exit codes
enum
{
	EXIT_Usage = 1,
	EXIT_BadInput = 2,
	EXIT_Quantize = 3,
	EXIT_BadOutput = 4,
};

// Parses the command line and converts one image. Returns the exit code.
int RunCommandLine(int argc, _TCHAR *argv[]);

// Command Line options
struct Opts
{
	tstring InPathname;
	tstring OutPathname;
	tstring PalPathname;
	int SampleFactor = 1;
	int DiffusionMode = 1;
	bool PaletteMatch = false;

	void DefaultOutPathname();
};
