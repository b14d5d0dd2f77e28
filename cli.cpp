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

#include <stdio.h>
#include <string>
#include <fstream>
#include <stdexcept>
#include <errno.h>
#include "nqgif.h"

#if defined(__linux__) || defined(__MACH__)
#include <cstring>
#include <getopt.h>
#endif

static int usage(_TCHAR *progname)
{
	_ftprintf(stderr, _T(
"Usage: %s [options] <source PPM> [dest GIF]\n"
"  Options:\n"
"    -q <factor>      Sampling factor, 1..30. 1 examines every pixel and\n"
"                     gives the best palette; higher values learn from\n"
"                     fewer pixels and run faster. Default is 1.\n"
"    -d <mode>        Error diffusion: 0 = none, 1 = Floyd-Steinberg,\n"
"                     2 = Jarvis-Judice-Ninke, 3 = Stucki, 4 = Burkes,\n"
"                     5 = Atkinson, 6 = Sierra-3, 7 = Sierra-2,\n"
"                     8 = Sierra-Lite. Default is 1.\n"
"    -m               Match colors by full palette search instead of the\n"
"                     quantizer's green index.\n"
"    -p <file>        Also save the palette as a JASC-PAL file.\n"
),
		progname);
	return EXIT_Usage;
}

static int Convert(const Opts &options)
{
	std::ifstream infile;
	infile.open(options.InPathname, std::ios_base::in | std::ios_base::binary);
	if (!infile.is_open())
	{
		_ftprintf(stderr, _T("Could not open %s: %s\n"), options.InPathname.c_str(), _tcserror(errno));
		return EXIT_BadInput;
	}
	ChunkyBitmap image;
	try
	{
		image = LoadPPM(infile);
	}
	catch (const std::exception &err)
	{
		_ftprintf(stderr, _T("Could not read %s: %s\n"), options.InPathname.c_str(), err.what());
		return EXIT_BadInput;
	}
	if (image.IsEmpty())
	{
		_ftprintf(stderr, _T("Could not read %s\n"), options.InPathname.c_str());
		return EXIT_BadInput;
	}
	printf("%dx%d\n", image.Width, image.Height);

	std::unique_ptr<Quantizer> quant{ NewNeuQuant(options.SampleFactor) };
	Palette palette;
	quant->AddPixels(image);
	try
	{
		palette = quant->GetPalette();
	}
	catch (const std::length_error &err)
	{
		fprintf(stderr, "%s\n", err.what());
		return EXIT_Quantize;
	}

	if (!options.PalPathname.empty() && !palette.WriteFile(options.PalPathname.c_str()))
	{
		return EXIT_BadOutput;
	}

	ChunkyBitmap indexed = image.RGBtoPalette(palette, options.DiffusionMode,
		options.PaletteMatch ? nullptr : quant.get());
	GIFWriter writer(options.OutPathname);
	if (!writer.Write(indexed, palette))
	{
		return EXIT_BadOutput;
	}
	return 0;
}

int RunCommandLine(int argc, _TCHAR* argv[])
{
	int opt;
	Opts options;

	// Start a fresh scan; glibc only resets its internal state for 0.
#ifdef __GLIBC__
	optind = 0;
#else
	optind = 1;
#endif

	while ((opt = getopt(argc, argv, "q:d:mp:")) != -1)
	{
		switch (opt)
		{
		case 'q':
			options.SampleFactor = _ttoi(optarg);
			break;
		case 'd':
			options.DiffusionMode = _ttoi(optarg);
			break;
		case 'm':
			options.PaletteMatch = true;
			break;
		case 'p':
			options.PalPathname = optarg;
			break;
		default:
			return usage(argv[0]);
		}
	}

	if (options.SampleFactor < 1 || options.SampleFactor > 30)
	{
		_ftprintf(stderr, _T("Sampling factor must be between 1 and 30\n"));
		return EXIT_Usage;
	}
	if (options.DiffusionMode < 0 || options.DiffusionMode > 8)
	{
		_ftprintf(stderr, _T("Diffusion mode must be between 0 and 8\n"));
		return EXIT_Usage;
	}

	if (optind >= argc)
	{
		return usage(argv[0]);
	}
	options.InPathname = argv[optind];
	if (optind + 1 < argc)
	{
		options.OutPathname = argv[optind + 1];
	}
	else
	{
		options.DefaultOutPathname();
	}

	try
	{
		return Convert(options);
	}
	catch (const std::exception &err)
	{
		// Input and quantizer failures are handled inside Convert, so
		// anything left happened while producing the output.
		fprintf(stderr, "%s\n", err.what());
		return EXIT_BadOutput;
	}
}
