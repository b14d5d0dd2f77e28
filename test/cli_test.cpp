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

#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "nqgif.h"

namespace {

std::string TempName(const std::string &name)
{
	return testing::TempDir() + "nqgif_cli_" + name;
}

void WritePPM(const std::string &filename, int w, int h)
{
	std::ofstream file(filename, std::ios_base::out | std::ios_base::binary);
	file << "P6\n" << w << " " << h << "\n255\n";
	for (int y = 0; y < h; ++y)
	{
		for (int x = 0; x < w; ++x)
		{
			file.put(char(x * 255 / w));
			file.put(char(y * 255 / h));
			file.put(char((x * 7 + y * 3) & 0xFF));
		}
	}
}

bool Exists(const std::string &filename)
{
	return std::ifstream(filename).good();
}

// Runs the command line with argv[0] filled in.
int Run(std::vector<std::string> args)
{
	args.insert(args.begin(), "nqgif");
	std::vector<char *> argv;
	for (auto &arg : args)
		argv.push_back(&arg[0]);
	argv.push_back(nullptr);
	return RunCommandLine((int)args.size(), argv.data());
}

} // namespace

TEST(CommandLine, ConvertsImage)
{
	std::string in = TempName("ok.ppm"), out = TempName("ok.gif"), pal = TempName("ok.pal");
	WritePPM(in, 40, 30);

	EXPECT_EQ(0, ::Run({ "-q", "2", "-p", pal, in, out }));

	std::ifstream gif(out, std::ios_base::in | std::ios_base::binary);
	std::string head(6, '\0');
	gif.read(&head[0], 6);
	EXPECT_EQ("GIF89a", head);
	gif.close();

	std::ifstream palfile(pal);
	std::string magic;
	std::getline(palfile, magic);
	EXPECT_EQ("JASC-PAL", magic);
	palfile.close();

	remove(in.c_str());
	remove(out.c_str());
	remove(pal.c_str());
}

TEST(CommandLine, DefaultOutputName)
{
	std::string in = TempName("named.ppm"), out = TempName("named.gif");
	WritePPM(in, 40, 30);
	EXPECT_EQ(0, ::Run({ "-m", "-d", "0", in }));
	EXPECT_TRUE(Exists(out));
	remove(in.c_str());
	remove(out.c_str());
}

TEST(CommandLine, BadOptionsFailBeforeReading)
{
	// The input doesn't exist, so reaching it would give a different code.
	std::string missing = TempName("never_created.ppm");
	EXPECT_EQ(EXIT_Usage, ::Run({ "-q", "31", missing }));
	EXPECT_EQ(EXIT_Usage, ::Run({ "-q", "0", missing }));
	EXPECT_EQ(EXIT_Usage, ::Run({ "-d", "9", missing }));
	EXPECT_EQ(EXIT_Usage, ::Run({ "-x", missing }));
	EXPECT_EQ(EXIT_Usage, ::Run({}));
}

TEST(CommandLine, UnreadableInput)
{
	EXPECT_EQ(EXIT_BadInput, ::Run({ TempName("never_created.ppm") }));

	std::string garbage = TempName("garbage.ppm");
	{
		std::ofstream file(garbage);
		file << "not a pixmap";
	}
	EXPECT_EQ(EXIT_BadInput, ::Run({ garbage, TempName("garbage.gif") }));
	remove(garbage.c_str());
}

TEST(CommandLine, HugeHeaderIsBadInput)
{
	std::string huge = TempName("huge.ppm");
	{
		std::ofstream file(huge, std::ios_base::out | std::ios_base::binary);
		file << "P6\n60000 60000\n255\n";
	}
	EXPECT_EQ(EXIT_BadInput, ::Run({ huge, TempName("huge.gif") }));
	remove(huge.c_str());
}

TEST(CommandLine, TooSmallImage)
{
	std::string in = TempName("small.ppm"), out = TempName("small.gif");
	WritePPM(in, 20, 20);
	EXPECT_EQ(EXIT_Quantize, ::Run({ in, out }));
	EXPECT_FALSE(Exists(out));
	remove(in.c_str());
}

TEST(CommandLine, UnwritableOutput)
{
	std::string in = TempName("unwritable.ppm");
	WritePPM(in, 40, 30);
	EXPECT_EQ(EXIT_BadOutput, ::Run({ in, TempName("no/such/dir/out.gif") }));
	EXPECT_EQ(EXIT_BadOutput, ::Run({ "-p", TempName("no/such/dir/out.pal"), in, TempName("unused.gif") }));
	remove(in.c_str());
}
