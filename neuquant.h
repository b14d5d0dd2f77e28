/* NeuQuant Neural-Net Quantization Algorithm
 * ------------------------------------------
 *
 * Copyright (c) 1994 Anthony Dekker
 *
 * NEUQUANT Neural-Net quantization algorithm by Anthony Dekker, 1994.
 * See "Kohonen neural networks for optimal colour quantization"
 * in "Network: Computation in Neural Systems" Vol. 5 (1994) pp 351-367.
 * for a discussion of the algorithm.
 * See also  http://www.acm.org/~dekker/NEUQUANT.HTML
 *
 * Any party obtaining a copy of these files from the author, directly or
 * indirectly, is granted, free of charge, a full and unrestricted irrevocable,
 * world-wide, paid up, royalty-free, nonexclusive right and license to deal
 * in this software and documentation files (the "Software"), including without
 * limitation the rights to use, copy, modify, merge, publish, distribute, sublicense,
 * and/or sell copies of the Software, and to permit persons who receive
 * copies from any such party to do so, with the only requirement being
 * that this copyright notice remain intact.
 */

#pragma once

#include <vector>
#include "nqgif.h"

class NeuQuant : public Quantizer
{
public:
	static constexpr int ncycles = 100;			// no. of learning cycles

	static constexpr int netsize = 256;			// number of colours used
	static constexpr int specials = 3;			// number of reserved colours used
	static constexpr int bgColour = specials - 1;	// reserved background colour
	static constexpr int cutnetsize = netsize - specials;
	static constexpr int maxnetpos = netsize - 1;

	static constexpr int initrad = netsize / 8;	// for 256 cols, radius starts at 32
	static constexpr int radiusbiasshift = 6;
	static constexpr int radiusbias = 1 << radiusbiasshift;
	static constexpr int initBiasRadius = initrad * radiusbias;
	static constexpr int radiusdec = 30;		// factor of 1/30 each cycle

	static constexpr int alphabiasshift = 10;			// alpha starts at 1
	static constexpr int initalpha = 1 << alphabiasshift;	// biased by 10 bits

	static constexpr double gamma = 1024.0;
	static constexpr double beta = 1.0 / 1024.0;
	static constexpr double betagamma = beta * gamma;

	// Four primes near 500. No image is assumed to have a length that
	// all four divide, so one of them always walks every pixel.
	static constexpr int prime1 = 499;
	static constexpr int prime2 = 491;
	static constexpr int prime3 = 487;
	static constexpr int prime4 = 503;
	static constexpr int minpixels = prime4;

	static constexpr int minsamplefac = 1;
	static constexpr int maxsamplefac = 30;

	// Schedule state right after one decay step.
	struct CycleState
	{
		int alpha;
		int biasRadius;
		int rad;
	};

	struct LearnLog
	{
		size_t visits = 0;		// pixels presented to the network
		int step = 0;			// traversal step through the pixel list
		std::vector<CycleState> cycles;
	};

	explicit NeuQuant(int sample = 1);

	void AddPixels(const uint8_t *rgba, size_t count) override;
	using Quantizer::AddPixels;
	Palette GetPalette() override;
	int MapColor(int r, int g, int b) const override { return lookup(r, g, b); }

	// Append pixels already packed as 0xRRGGBB.
	void AddPacked(const int *packed, size_t count);

	// Checks the pixel count, then runs learn(), fix() and inxbuild().
	void init();

	void setUpArrays();
	int specialFind(double r, double g, double b) const;
	int contest(double r, double g, double b);
	void altersingle(double alpha, int i, double r, double g, double b);
	void alterneigh(double alpha, int rad, int i, double r, double g, double b);
	void learn();
	void fix();
	void inxbuild();

	// Palette index (learned order) of the entry closest to r,g,b.
	int lookup(int r, int g, int b) const;

	static int selectStep(size_t lengthcount);
	static int calcRad(int biasRadius)
	{
		int rad = biasRadius >> radiusbiasshift;
		return rad <= 1 ? 0 : rad;
	}

	int getSampleFactor() const { return samplefac; }
	size_t getPixelCount() const { return pixels.size(); }
	const double *getNeuron(int i) const { return network[i]; }
	double getFreq(int i) const { return freq[i]; }
	double getBias(int i) const { return bias[i]; }
	int getNetIndex(int g) const { return netindex[g]; }
	const LearnLog &getLearnLog() const { return learnlog; }

	// Colour of neuron i after fix().
	ColorRegister getColor(int i) const;
	// Entry i of the green-sorted colour map after inxbuild().
	ColorRegister getSortedColor(int i) const;
	int getSortedSource(int i) const { return colormap[i][3]; }

private:
	double network[netsize][3] = {};	// the network itself
	int colormap[netsize][4] = {};		// r, g, b, learned position
	int sortpos[netsize] = {};			// learned position -> colormap row

	int netindex[256] = {};	// for network lookup - really 256

	double bias[netsize] = {};	// bias and freq arrays for learning
	double freq[netsize] = {};

	std::vector<int> pixels;
	int samplefac = 1;
	LearnLog learnlog;
};
