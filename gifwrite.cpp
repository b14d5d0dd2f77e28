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
#include <cstring>
#include <errno.h>
#include <unordered_map>
#include "nqgif.h"

// GIF restricts codes to 12 bits max
#define CODE_LIMIT (1 << 12)

// Packs variable-width LZW codes into the length-prefixed sub-blocks GIF
// image data is stored in.
class CodeStream
{
public:
	CodeStream(uint8_t mincodesize, std::vector<uint8_t> &codes);
	~CodeStream();
	void AddByte(uint8_t p);

private:
	std::vector<uint8_t> &Codes;
	uint32_t Accum = 0;
	uint16_t ClearCode;
	uint16_t EOICode;
	uint16_t NextCode = 0;	// next code to assign
	int16_t Match = -1;		// code of string matched so far
	uint8_t CodeSize;		// in bits
	uint8_t MinCodeSize;
	int8_t BitPos = 0;
	uint8_t Chunk[256];		// first byte is length

	// A code string is a code word with one pixel appended, so the key is
	// the code word in bits 0-15, the pixel in bits 16-23, and bit 24 set
	// to tell a string ending in pixel 0 apart from a bare code word.
	typedef std::unordered_map<uint32_t, uint16_t> DictType;
	DictType Dict;

	void WriteCode(uint16_t code);
	void ResetDict();
	void DumpAccum(bool full);
	void Dump();
};

CodeStream::CodeStream(uint8_t mincodesize, std::vector<uint8_t> &codes)
	: Codes(codes), MinCodeSize(mincodesize)
{
	CodeSize = MinCodeSize + 1;
	ClearCode = 1 << MinCodeSize;
	EOICode = ClearCode + 1;
	memset(Chunk, 0, sizeof(Chunk));
	WriteCode(ClearCode);
}

CodeStream::~CodeStream()
{
	if (Match >= 0)
	{
		WriteCode(Match);
	}
	WriteCode(EOICode);
	DumpAccum(true);
	Dump();
	// Block terminator
	Codes.push_back(0);
}

void CodeStream::Dump()
{
	if (Chunk[0] > 0)
	{
		Codes.insert(Codes.end(), Chunk, Chunk + Chunk[0] + 1);
		Chunk[0] = 0;
	}
}

void CodeStream::WriteCode(uint16_t code)
{
	Accum |= (uint32_t)code << BitPos;
	BitPos += CodeSize;
	DumpAccum(false);
	if (code == ClearCode)
	{
		ResetDict();
	}
}

// If <full> is true, dump every accumulated bit.
// If <full> is false, only dump every complete accumulated byte.
void CodeStream::DumpAccum(bool full)
{
	int8_t stop = full ? 0 : 7;
	while (BitPos > stop)
	{
		Chunk[1 + Chunk[0]] = Accum & 0xFF;
		Accum >>= 8;
		BitPos -= 8;
		if (++Chunk[0] == 255)
		{
			Dump();
		}
	}
	if (BitPos < 0)
	{
		BitPos = 0;
	}
}

void CodeStream::AddByte(uint8_t p)
{
	if (Match < 0)
	{ // Start a new run. Every single pixel value is always in the dictionary.
		Match = p;
		return;
	}
	uint32_t str = (uint32_t)Match | ((uint32_t)p << 16) | (1u << 24);
	DictType::const_iterator got = Dict.find(str);
	if (got != Dict.end())
	{ // Keep extending the match.
		Match = got->second;
		return;
	}
	// Emit the longest match and remember it with p appended.
	WriteCode(Match);
	Dict[str] = NextCode++;
	if (NextCode == CODE_LIMIT)
	{
		WriteCode(ClearCode);
	}
	else if (NextCode == (1 << CodeSize) + 1)
	{
		CodeSize++;
	}
	Match = p;
}

void CodeStream::ResetDict()
{
	CodeSize = MinCodeSize + 1;
	NextCode = EOICode + 1;
	Match = -1;
	Dict.clear();
}

// Compresses an 8-bit bitmap into GIF image data: the minimum code size
// byte followed by the sub-blocks.
void LZWCompress(std::vector<uint8_t> &vec, const ChunkyBitmap &chunky, uint8_t mincodesize)
{
	mincodesize = std::clamp<uint8_t>(mincodesize, 2, 8);
	vec.push_back(mincodesize);
	CodeStream codes(mincodesize, vec);
	const uint8_t *in = chunky.Pixels;
	for (int y = 0; y < chunky.Height; ++y, in += chunky.Pitch)
	{
		for (int x = 0; x < chunky.Width; ++x)
		{
			codes.AddByte(in[x]);
		}
	}
}

GIFWriter::GIFWriter(const tstring &filename)
	: Filename(filename)
{
}

GIFWriter::~GIFWriter()
{
	if (File != nullptr)
	{
		fclose(File);
	}
}

void GIFWriter::BadWrite()
{
	_ftprintf(stderr, _T("Could not write to %s: %s\n"), Filename.c_str(), _tcserror(errno));
	fclose(File);
	File = nullptr;
}

bool GIFWriter::Write(const ChunkyBitmap &chunky, const Palette &pal)
{
	if (chunky.IsEmpty() || chunky.BytesPerPixel != 1 || pal.empty())
	{
		_ftprintf(stderr, _T("Nothing to write to %s\n"), Filename.c_str());
		return false;
	}
	if (chunky.Width > 65535 || chunky.Height > 65535)
	{
		_ftprintf(stderr, _T("%dx%d is too large for a GIF\n"), chunky.Width, chunky.Height);
		return false;
	}
	Palette global = pal.Extend();

	File = _tfopen(Filename.c_str(), _T("wb"));
	if (File == nullptr)
	{
		_ftprintf(stderr, _T("Could not open %s: %s\n"), Filename.c_str(), _tcserror(errno));
		return false;
	}
	return WriteHeader(chunky, global) && WriteImage(chunky, global.Bits()) && FinishFile();
}

bool GIFWriter::WriteHeader(const ChunkyBitmap &chunky, const Palette &pal)
{
	LogicalScreenDescriptor lsd = { LittleShort((uint16_t)chunky.Width), LittleShort((uint16_t)chunky.Height), 0, 0, 0 };

	// Global color table present, 8 bits of color resolution
	lsd.Flags = 0xF0 | (pal.Bits() - 1);

	if (fwrite("GIF89a", 6, 1, File) != 1 || fwrite(&lsd, 7, 1, File) != 1 ||
		fwrite(&pal[0], 3, pal.size(), File) != pal.size())
	{
		BadWrite();
		return false;
	}
	return true;
}

bool GIFWriter::WriteImage(const ChunkyBitmap &chunky, int mincodesize)
{
	ImageDescriptor imd = { 0, 0, LittleShort((uint16_t)chunky.Width), LittleShort((uint16_t)chunky.Height), 0 };
	std::vector<uint8_t> lzw;

	LZWCompress(lzw, chunky, mincodesize);
	if (fputc(0x2C, File) /* Image Separator */ == EOF ||
		fwrite(&imd, 9, 1, File) != 1 ||
		fwrite(lzw.data(), 1, lzw.size(), File) != lzw.size())
	{
		BadWrite();
		return false;
	}
	return true;
}

bool GIFWriter::FinishFile()
{
	// The 0x3B is a trailer byte to terminate the GIF.
	if (fputc(0x3B, File) == EOF)
	{
		BadWrite();
		return false;
	}
	FILE *file = File;
	File = nullptr;
	if (fclose(file) != 0)
	{
		_ftprintf(stderr, _T("Could not write to %s: %s\n"), Filename.c_str(), _tcserror(errno));
		return false;
	}
	return true;
}
